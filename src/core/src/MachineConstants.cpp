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

#include "backplane/MachineConstants.hpp"
#include "backplane/ProvisioningBundle.hpp"

#include <utility>

namespace backplane {

MachineConstants MachineConstants::generic_6502() {
    MachineConstants constants;
    constants.name = "Generic 6502";
    constants.type_id = "generic-6502";
    constants.address_space_bits = 16;
    constants.min_ram_size = 4 * 1024;
    constants.max_ram_size = 64 * 1024;
    constants.default_ram_size = 64 * 1024;
    constants.ram_base = 0x0000;
    constants.boot_rom_size = 0;
    constants.boot_rom_base = 0;
    constants.io_page_base = std::nullopt;
    constants.slot_count = 0;
    return constants;
}

MachineConstants MachineConstants::apple_ii_plus() {
    MachineConstants constants;
    constants.name = "Apple II+";
    constants.type_id = "apple2plus";
    constants.address_space_bits = 16;
    constants.min_ram_size = 16 * 1024;
    constants.max_ram_size = 48 * 1024;
    constants.default_ram_size = 48 * 1024;
    constants.ram_base = 0x0000;
    constants.boot_rom_size = 12 * 1024;
    constants.boot_rom_base = 0xD000;
    constants.io_page_base = 0xC000;
    constants.slot_count = 7;
    return constants;
}

ProvisioningBundleBuilder ProvisioningBundle::builder() {
    return ProvisioningBundleBuilder{};
}

ProvisioningBundleBuilder& ProvisioningBundleBuilder::with_ram_size(uint32_t size) {
    bundle_.ram_size = size;
    return *this;
}

ProvisioningBundleBuilder& ProvisioningBundleBuilder::with_rom_image(std::string id,
                                                                     std::vector<uint8_t> data) {
    bundle_.rom_images[std::move(id)] = std::move(data);
    return *this;
}

ProvisioningBundleBuilder& ProvisioningBundleBuilder::with_rom_image(std::string id,
                                                                     std::span<const uint8_t> data) {
    return with_rom_image(std::move(id), std::vector<uint8_t>(data.begin(), data.end()));
}

ProvisioningBundleBuilder& ProvisioningBundleBuilder::with_device(DeviceConfiguration configuration) {
    bundle_.devices.push_back(std::move(configuration));
    return *this;
}

ProvisioningBundleBuilder& ProvisioningBundleBuilder::with_device(std::string type, std::optional<int> slot,
                                                                  std::map<std::string, std::string> options) {
    return with_device(DeviceConfiguration{std::move(type), slot, std::move(options)});
}

ProvisioningBundleBuilder& ProvisioningBundleBuilder::with_layout_override(std::string region_id, Addr base) {
    bundle_.layout_overrides[std::move(region_id)] = base;
    return *this;
}

ProvisioningBundleBuilder& ProvisioningBundleBuilder::with_debug_features(bool enable) {
    bundle_.enable_debug_features = enable;
    return *this;
}

} // namespace backplane
