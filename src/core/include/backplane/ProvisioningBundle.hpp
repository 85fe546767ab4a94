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

#include "Types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace backplane {

class ProvisioningBundleBuilder;

// One device to create at bring-up, e.g. {"rom_card", 6, {{"rom", "disk2"}}}.
struct DeviceConfiguration {
    std::string type;
    std::optional<int> slot;
    std::map<std::string, std::string> options;

    std::optional<std::string> option(const std::string& key) const {
        auto it = options.find(key);
        return it == options.end() ? std::nullopt : std::optional<std::string>(it->second);
    }
};

// The concrete parts list for one machine instance.
//
// ROM images are keyed by name; "boot" is the system ROM. Devices refer to
// further images by name through their options.
struct ProvisioningBundle {
    static constexpr const char* kBootRomImage = "boot";

    uint32_t ram_size = 0;  // 0 selects the machine's default
    std::map<std::string, std::vector<uint8_t>> rom_images;
    std::vector<DeviceConfiguration> devices;
    std::map<std::string, Addr> layout_overrides;  // Region id -> base
    bool enable_debug_features = false;

    static ProvisioningBundleBuilder builder();
};

class ProvisioningBundleBuilder {
public:
    ProvisioningBundleBuilder& with_ram_size(uint32_t size);
    ProvisioningBundleBuilder& with_rom_image(std::string id, std::vector<uint8_t> data);
    ProvisioningBundleBuilder& with_rom_image(std::string id, std::span<const uint8_t> data);
    ProvisioningBundleBuilder& with_device(DeviceConfiguration configuration);
    ProvisioningBundleBuilder& with_device(std::string type, std::optional<int> slot = std::nullopt,
                                           std::map<std::string, std::string> options = {});
    ProvisioningBundleBuilder& with_layout_override(std::string region_id, Addr base);
    ProvisioningBundleBuilder& with_debug_features(bool enable = true);

    ProvisioningBundle build() const { return bundle_; }

private:
    ProvisioningBundle bundle_;
};

} // namespace backplane
