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

#include "BusAccess.hpp"
#include "PageEntry.hpp"
#include "Types.hpp"

#include <cstdint>
#include <string_view>

namespace backplane {

// Why a guest access did not reach a device. Reported only by the
// MemoryBus::try_* methods; the ordinary access path silently floats.
enum class FaultKind : uint8_t {
    None,
    Unmapped,    // No target on the page (or composite resolved to nothing)
    Permission,  // Page lacks Read or Write permission
    NoExecute,   // Instruction fetch from a page without Execute permission
};

std::string_view to_string(FaultKind kind);

struct BusFault {
    FaultKind kind = FaultKind::None;
    Addr address = 0;
    AccessIntent intent = AccessIntent::DataRead;
    uint32_t device_id = 0;
    RegionTag tag = RegionTag::Unmapped;

    bool is_fault() const { return kind != FaultKind::None; }
};

template<typename T>
struct BusResult {
    T value{};
    BusFault fault;

    bool ok() const { return !fault.is_fault(); }
};

} // namespace backplane
