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

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace backplane {

struct DeviceInfo {
    uint32_t id = 0;
    std::string kind;         // Device type, e.g. "ram", "keyboard"
    std::string name;         // Human readable name
    std::string wiring_path;  // Where it is attached, e.g. "motherboard", "slot/6"
};

// Numeric identities for everything that answers on the bus. Ids are
// stamped into page entries so a page can be traced back to its device.
// Id 0 is reserved for "no device" (and for the CPU as an access source).
class DeviceRegistry {
public:
    // Next unused id
    uint32_t generate_id() { return next_id_++; }

    // Throws std::invalid_argument for id 0 or a duplicate id
    void register_device(uint32_t id, std::string kind, std::string name, std::string wiring_path);

    bool contains(uint32_t id) const { return devices_.contains(id); }
    const DeviceInfo* find(uint32_t id) const;

    // Throws std::out_of_range if unknown
    const DeviceInfo& get(uint32_t id) const;

    // Ordered by id
    std::vector<DeviceInfo> devices() const;
    std::size_t count() const { return devices_.size(); }

private:
    std::map<uint32_t, DeviceInfo> devices_;
    uint32_t next_id_ = 1;
};

} // namespace backplane
