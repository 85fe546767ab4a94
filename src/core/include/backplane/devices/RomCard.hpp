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

#include "backplane/Peripheral.hpp"
#include "backplane/PhysicalMemory.hpp"
#include "RomTarget.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace backplane {

// Generic peripheral card carrying firmware only: a slot ROM of up to 256
// bytes at $Cn00 and, optionally, an expansion ROM of up to 2KB at $C800.
// Shorter images are padded with $FF.
class RomCard final : public SlotCard {
public:
    static constexpr std::string_view kDeviceType = "rom_card";
    static constexpr uint32_t kSlotRomSize = 0x100;
    static constexpr uint32_t kExpansionRomSize = 0x800;

    // Throws std::invalid_argument for an empty or oversized image
    RomCard(std::string name, std::span<const uint8_t> slot_rom,
            std::span<const uint8_t> expansion_rom = {});

    std::string_view name() const override { return name_; }
    std::string_view device_type() const override { return kDeviceType; }

    void initialize(EventContext&) override {}
    void reset() override { expansion_selected_ = false; }

    BusTarget* slot_rom() override { return &slot_rom_target_; }
    BusTarget* expansion_rom() override {
        return expansion_rom_target_ ? &*expansion_rom_target_ : nullptr;
    }

    void on_expansion_rom_selected() override { expansion_selected_ = true; }
    void on_expansion_rom_deselected() override { expansion_selected_ = false; }

    bool expansion_selected() const { return expansion_selected_; }

private:
    std::string name_;
    PhysicalMemory slot_rom_;
    std::unique_ptr<PhysicalMemory> expansion_rom_;
    RomTarget slot_rom_target_;
    std::optional<RomTarget> expansion_rom_target_;
    bool expansion_selected_ = false;
};

} // namespace backplane
