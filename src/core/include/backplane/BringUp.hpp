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

#ifndef BACKPLANE_BRING_UP_HPP
#define BACKPLANE_BRING_UP_HPP

#include "MachineConstants.hpp"
#include "Motherboard.hpp"
#include "ProvisioningBundle.hpp"
#include "RegionManager.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace backplane {

struct BringUpValidation {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    bool ok() const { return errors.empty(); }
};

struct BringUpResult {
    bool success = false;
    std::string error_message;
    std::vector<std::string> warnings;
    std::vector<RegionPlacement> placements;
    std::unique_ptr<Motherboard> motherboard;

    static BringUpResult failed(std::string message, std::vector<std::string> warnings = {});
};

// Builds a Motherboard from a machine model and a provisioning bundle.
//
// Bring-up never throws for a bad bundle: problems found by validate() and
// anything thrown while the board is assembled come back as a failed
// result. Nothing is wired to a CPU; callers attach one afterwards.
class BringUp {
public:
    static constexpr const char* kMainRamId = "main_ram";
    static constexpr const char* kBootRomId = "boot_rom";
    static constexpr const char* kIoPageId = "io_page";
    static constexpr const char* kLanguageCardPool = "language_card";

    // Creates a peripheral for one device configuration. The board is fully
    // laid out but devices are not yet initialized.
    using DeviceFactory = std::function<std::unique_ptr<Peripheral>(
        Motherboard&, const DeviceConfiguration&, const ProvisioningBundle&)>;

    explicit BringUp(MachineConstants constants);

    const MachineConstants& constants() const { return constants_; }

    // Replaces any factory already registered for the type
    void register_device_factory(std::string type, DeviceFactory factory);
    bool has_device_factory(std::string_view type) const;

    BringUpValidation validate(const ProvisioningBundle& bundle) const;

    BringUpResult bring_up(const ProvisioningBundle& bundle) const;

private:
    uint32_t ram_size(const ProvisioningBundle& bundle) const;
    void validate_devices(const ProvisioningBundle& bundle, BringUpValidation& validation) const;
    void create_regions(Motherboard& board, const ProvisioningBundle& bundle) const;
    void create_devices(Motherboard& board, const ProvisioningBundle& bundle) const;

    MachineConstants constants_;
    std::map<std::string, DeviceFactory, std::less<>> factories_;
};

} // namespace backplane

#endif // BACKPLANE_BRING_UP_HPP
