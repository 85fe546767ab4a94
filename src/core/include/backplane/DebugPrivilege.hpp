// Copyright © 2025 Robert Smallshire <robert@smallshire.org.uk>
//
// This file is part of Backplane.
//
// Backplane is free software: you can redistribute it and/or modify it under the terms of the
// GNU General Public License as published by the Free Software Foundation, either version 3 of the
// License, or (at your option) any later version. Backplane is distributed in the hope that it will
// be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
// You should have received a copy of the GNU General Public License along with Backplane.
// If not, see <https://www.gnu.org/licenses/>.

#pragma once

#include <string>
#include <utility>

namespace backplane {

// Capability required to mutate physical memory directly (ROM loading,
// memory editors, debugger pokes). Deliberately unrelated to BusAccess so a
// guest write can never be mistaken for a tool write.
class DebugPrivilege {
public:
    explicit DebugPrivilege(std::string holder)
        : holder_(std::move(holder)) {}

    // Who is exercising the privilege (e.g. "bring-up", "debugger")
    const std::string& holder() const { return holder_; }

private:
    std::string holder_;
};

} // namespace backplane
