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

#include "backplane/DeviceRegistry.hpp"

#include <stdexcept>
#include <utility>

namespace backplane {

void DeviceRegistry::register_device(uint32_t id, std::string kind, std::string name,
                                     std::string wiring_path) {
    if (id == 0) {
        throw std::invalid_argument("Device id 0 is reserved");
    }
    if (devices_.contains(id)) {
        throw std::invalid_argument("Device with id " + std::to_string(id) + " is already registered");
    }
    devices_.emplace(id, DeviceInfo{id, std::move(kind), std::move(name), std::move(wiring_path)});
    if (id >= next_id_) {
        next_id_ = id + 1;
    }
}

const DeviceInfo* DeviceRegistry::find(uint32_t id) const {
    auto it = devices_.find(id);
    return it == devices_.end() ? nullptr : &it->second;
}

const DeviceInfo& DeviceRegistry::get(uint32_t id) const {
    if (const DeviceInfo* info = find(id)) {
        return *info;
    }
    throw std::out_of_range("No device registered with id " + std::to_string(id));
}

std::vector<DeviceInfo> DeviceRegistry::devices() const {
    std::vector<DeviceInfo> result;
    result.reserve(devices_.size());
    for (const auto& [id, info] : devices_) {
        result.push_back(info);
    }
    return result;
}

} // namespace backplane
