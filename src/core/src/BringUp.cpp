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

#include "backplane/BringUp.hpp"
#include "backplane/DebugPrivilege.hpp"
#include "backplane/PhysicalMemory.hpp"
#include "backplane/devices/IoPage.hpp"
#include "backplane/devices/KeyboardController.hpp"
#include "backplane/devices/LanguageCard.hpp"
#include "backplane/devices/RomCard.hpp"
#include "backplane/devices/SpeakerController.hpp"

#include <algorithm>
#include <iomanip>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace backplane {

namespace {

constexpr const char* kRomOption = "rom";
constexpr const char* kExpansionRomOption = "expansion_rom";
constexpr const char* kNameOption = "name";

std::string hex(uint64_t value) {
    std::ostringstream oss;
    oss << "$" << std::hex << std::uppercase << std::setw(4) << std::setfill('0') << value;
    return oss.str();
}

std::string join(const std::vector<std::string>& parts, const char* separator) {
    std::string result;
    for (const auto& part : parts) {
        if (!result.empty()) result += separator;
        result += part;
    }
    return result;
}

// Devices that decode Apple II soft switches and so need an I/O page
bool needs_io_page(std::string_view type) {
    return type == KeyboardController::kDeviceType
        || type == SpeakerController::kDeviceType
        || type == LanguageCard::kDeviceType
        || type == RomCard::kDeviceType;
}

const std::vector<uint8_t>& rom_image(const ProvisioningBundle& bundle, const std::string& id) {
    auto it = bundle.rom_images.find(id);
    if (it == bundle.rom_images.end()) {
        throw std::invalid_argument("No ROM image named '" + id + "'");
    }
    return it->second;
}

std::unique_ptr<Peripheral> make_keyboard(Motherboard& board, const DeviceConfiguration&,
                                          const ProvisioningBundle&) {
    return std::make_unique<KeyboardController>(board.io());
}

std::unique_ptr<Peripheral> make_speaker(Motherboard& board, const DeviceConfiguration&,
                                         const ProvisioningBundle&) {
    return std::make_unique<SpeakerController>(board.io());
}

std::unique_ptr<Peripheral> make_language_card(Motherboard& board, const DeviceConfiguration&,
                                               const ProvisioningBundle&) {
    PhysicalMemory& pool = board.add_pool(BringUp::kLanguageCardPool, LanguageCard::kPoolSize,
                                          "Language Card RAM");
    return std::make_unique<LanguageCard>(board.regions(), board.io(), pool);
}

std::unique_ptr<Peripheral> make_rom_card(Motherboard&, const DeviceConfiguration& config,
                                          const ProvisioningBundle& bundle) {
    const auto rom = config.option(kRomOption);
    if (!rom) {
        throw std::invalid_argument("rom_card needs a 'rom' option");
    }
    const std::vector<uint8_t>& slot_rom = rom_image(bundle, *rom);
    std::span<const uint8_t> expansion_rom;
    if (const auto expansion = config.option(kExpansionRomOption)) {
        expansion_rom = rom_image(bundle, *expansion);
    }
    std::string name = config.option(kNameOption).value_or("ROM Card (" + *rom + ")");
    return std::make_unique<RomCard>(std::move(name), slot_rom, expansion_rom);
}

} // namespace

BringUpResult BringUpResult::failed(std::string message, std::vector<std::string> warnings) {
    BringUpResult result;
    result.success = false;
    result.error_message = std::move(message);
    result.warnings = std::move(warnings);
    return result;
}

BringUp::BringUp(MachineConstants constants)
    : constants_(std::move(constants))
{
    register_device_factory(std::string(KeyboardController::kDeviceType), make_keyboard);
    register_device_factory(std::string(SpeakerController::kDeviceType), make_speaker);
    register_device_factory(std::string(LanguageCard::kDeviceType), make_language_card);
    register_device_factory(std::string(RomCard::kDeviceType), make_rom_card);
}

void BringUp::register_device_factory(std::string type, DeviceFactory factory) {
    if (!factory) {
        throw std::invalid_argument("Device factory for '" + type + "' is empty");
    }
    factories_[std::move(type)] = std::move(factory);
}

bool BringUp::has_device_factory(std::string_view type) const {
    return factories_.find(type) != factories_.end();
}

uint32_t BringUp::ram_size(const ProvisioningBundle& bundle) const {
    return bundle.ram_size != 0 ? bundle.ram_size : constants_.default_ram_size;
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

BringUpValidation BringUp::validate(const ProvisioningBundle& bundle) const {
    BringUpValidation validation;
    const uint64_t space = constants_.address_space_size();

    const uint32_t ram = ram_size(bundle);
    if (ram < constants_.min_ram_size || ram > constants_.max_ram_size) {
        validation.errors.push_back(
            "RAM size " + std::to_string(ram) + " is outside " + constants_.name + " limits (" +
            std::to_string(constants_.min_ram_size) + "-" + std::to_string(constants_.max_ram_size) + ")");
    } else if (!is_page_aligned(ram)) {
        validation.errors.push_back("RAM size " + std::to_string(ram) + " is not a multiple of the page size");
    } else if (uint64_t{constants_.ram_base} + ram > space) {
        validation.errors.push_back("RAM does not fit in the address space");
    }

    auto boot = bundle.rom_images.find(ProvisioningBundle::kBootRomImage);
    if (boot == bundle.rom_images.end()) {
        validation.errors.push_back("No boot ROM image ('" + std::string(ProvisioningBundle::kBootRomImage) + "')");
    } else {
        const uint64_t size = boot->second.size();
        if (constants_.boot_rom_size != 0) {
            if (size != constants_.boot_rom_size) {
                validation.errors.push_back(
                    "Boot ROM is " + std::to_string(size) + " bytes; " + constants_.name +
                    " expects " + std::to_string(constants_.boot_rom_size));
            }
        } else if (size == 0 || !is_page_aligned(size) || size > space) {
            validation.errors.push_back(
                "Boot ROM of " + std::to_string(size) + " bytes is not a whole number of pages "
                "within the address space");
        }
    }

    validate_devices(bundle, validation);

    const std::set<std::string> known_regions{kMainRamId, kBootRomId, kIoPageId};
    for (const auto& [region_id, base] : bundle.layout_overrides) {
        if (!known_regions.contains(region_id)) {
            validation.warnings.push_back("Layout override for unknown region '" + region_id + "' ignored");
        } else if (!is_page_aligned(base)) {
            validation.errors.push_back("Layout override for '" + region_id + "' at " + hex(base) +
                                        " is not page aligned");
        }
    }

    std::set<std::string> referenced{ProvisioningBundle::kBootRomImage};
    for (const auto& config : bundle.devices) {
        for (const char* option : {kRomOption, kExpansionRomOption}) {
            if (auto id = config.option(option)) {
                referenced.insert(*id);
            }
        }
    }
    for (const auto& [id, image] : bundle.rom_images) {
        if (!referenced.contains(id)) {
            validation.warnings.push_back("ROM image '" + id + "' is not used by any device");
        }
    }

    return validation;
}

void BringUp::validate_devices(const ProvisioningBundle& bundle, BringUpValidation& validation) const {
    const int last_slot = std::min(kLastSlot, constants_.slot_count);
    std::map<int, std::string> slots_taken;
    std::set<std::string> motherboard_devices;

    for (const auto& config : bundle.devices) {
        if (!has_device_factory(config.type)) {
            validation.errors.push_back("Unknown device type '" + config.type + "'");
            continue;
        }
        if (needs_io_page(config.type) && !constants_.has_io_page()) {
            validation.errors.push_back("Device '" + config.type + "' needs an I/O page, which " +
                                        constants_.name + " does not have");
            continue;
        }

        if (config.type == RomCard::kDeviceType) {
            if (!config.slot) {
                validation.errors.push_back("rom_card needs a slot");
                continue;
            }
            const auto rom = config.option(kRomOption);
            if (!rom) {
                validation.errors.push_back("rom_card in slot " + std::to_string(*config.slot) +
                                            " has no 'rom' option");
            } else if (!bundle.rom_images.contains(*rom)) {
                validation.errors.push_back("rom_card in slot " + std::to_string(*config.slot) +
                                            " refers to missing ROM image '" + *rom + "'");
            }
            if (const auto expansion = config.option(kExpansionRomOption);
                expansion && !bundle.rom_images.contains(*expansion)) {
                validation.errors.push_back("rom_card in slot " + std::to_string(*config.slot) +
                                            " refers to missing ROM image '" + *expansion + "'");
            }
        } else if (config.type == LanguageCard::kDeviceType) {
            if (config.slot && *config.slot != 0) {
                validation.errors.push_back("The language card can only go in slot 0");
            }
        } else if (needs_io_page(config.type) && config.slot) {
            validation.errors.push_back("Device '" + config.type + "' is built in and takes no slot");
        }

        if (config.slot && *config.slot != 0) {
            const int slot = *config.slot;
            if (slot < kFirstSlot || slot > last_slot) {
                validation.errors.push_back("Slot " + std::to_string(slot) + " for '" + config.type +
                                            "' does not exist on " + constants_.name);
            } else if (auto [it, inserted] = slots_taken.emplace(slot, config.type); !inserted) {
                validation.errors.push_back("Slot conflict: slot " + std::to_string(slot) +
                                            " is wanted by both '" + it->second + "' and '" +
                                            config.type + "'");
            }
        } else if (!motherboard_devices.insert(config.type).second) {
            validation.errors.push_back("Device '" + config.type + "' is listed more than once");
        }
    }
}

// ---------------------------------------------------------------------------
// Assembly
// ---------------------------------------------------------------------------

BringUpResult BringUp::bring_up(const ProvisioningBundle& bundle) const {
    BringUpValidation validation = validate(bundle);
    if (!validation.ok()) {
        return BringUpResult::failed("Invalid provisioning bundle: " + join(validation.errors, "; "),
                                     std::move(validation.warnings));
    }

    try {
        auto board = std::make_unique<Motherboard>(constants_, bundle.enable_debug_features);
        create_regions(*board, bundle);
        std::vector<RegionPlacement> placements = board->regions().place_regions();
        create_devices(*board, bundle);
        board->initialize_devices();

        BringUpResult result;
        result.success = true;
        result.warnings = std::move(validation.warnings);
        result.placements = std::move(placements);
        result.motherboard = std::move(board);
        return result;
    } catch (const std::exception& e) {
        return BringUpResult::failed(std::string("Bring-up failed: ") + e.what(),
                                     std::move(validation.warnings));
    }
}

void BringUp::create_regions(Motherboard& board, const ProvisioningBundle& bundle) const {
    DeviceRegistry& devices = board.devices();
    std::vector<std::shared_ptr<MemoryRegion>> regions;

    const std::vector<uint8_t>& image = bundle.rom_images.at(ProvisioningBundle::kBootRomImage);
    const auto rom_size = static_cast<uint32_t>(image.size());
    PhysicalMemory& rom = board.add_pool(kBootRomId, rom_size, "Boot ROM");
    rom.write_physical(DebugPrivilege("bring-up"), 0, image);
    auto rom_region = MemoryRegion::rom(kBootRomId, "Boot ROM", constants_.boot_rom_base_for(rom_size), rom, 0);
    rom_region->device_id = devices.generate_id();
    devices.register_device(rom_region->device_id, "rom", rom_region->name, "motherboard");
    regions.push_back(rom_region);

    if (constants_.io_page_base) {
        auto io_region = std::make_shared<MemoryRegion>();
        io_region->id = kIoPageId;
        io_region->name = "I/O Page";
        io_region->preferred_base = *constants_.io_page_base;
        io_region->size = kPageSize;
        io_region->tag = RegionTag::Io;
        io_region->default_perms = PagePerms::All;  // Slot firmware runs from $Cnxx
        io_region->target = std::make_shared<IoPageTarget>(board.io(), board.slots());
        io_region->priority = 0;
        io_region->device_id = devices.generate_id();
        devices.register_device(io_region->device_id, "io", io_region->name, "motherboard");
        regions.push_back(io_region);
    }

    const uint32_t ram = ram_size(bundle);
    PhysicalMemory& ram_pool = board.add_pool(kMainRamId, ram, "Main RAM");
    auto ram_region = MemoryRegion::ram(kMainRamId, "Main RAM", constants_.ram_base, ram_pool, 1);
    ram_region->device_id = devices.generate_id();
    devices.register_device(ram_region->device_id, "ram", ram_region->name, "motherboard");
    regions.push_back(ram_region);

    for (auto& region : regions) {
        if (auto it = bundle.layout_overrides.find(region->id); it != bundle.layout_overrides.end()) {
            region->preferred_base = it->second;
        }
        board.regions().register_region(region);
    }
}

void BringUp::create_devices(Motherboard& board, const ProvisioningBundle& bundle) const {
    DeviceRegistry& devices = board.devices();

    for (const auto& config : bundle.devices) {
        auto factory = factories_.find(config.type);
        if (factory == factories_.end()) {
            throw std::invalid_argument("Unknown device type '" + config.type + "'");
        }
        std::unique_ptr<Peripheral> peripheral = factory->second(board, config, bundle);
        if (!peripheral) {
            throw std::logic_error("Factory for '" + config.type + "' produced no device");
        }

        const uint32_t id = devices.generate_id();
        peripheral->set_device_id(id);

        std::string wiring_path = "motherboard";
        if (peripheral->kind() == PeripheralKind::SlotCard) {
            if (!config.slot) {
                throw std::invalid_argument("Slot card '" + config.type + "' has no slot");
            }
            board.slots().install(*config.slot, static_cast<SlotCard&>(*peripheral));
            wiring_path = "slot/" + std::to_string(*config.slot);
        } else if (config.slot) {
            wiring_path = "slot/" + std::to_string(*config.slot);
        }

        devices.register_device(id, std::string(peripheral->device_type()),
                                std::string(peripheral->name()), wiring_path);
        board.add_peripheral(std::move(peripheral));
    }
}

} // namespace backplane
