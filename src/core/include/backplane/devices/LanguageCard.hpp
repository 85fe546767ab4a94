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
#include "backplane/Types.hpp"

#include <cstdint>
#include <string_view>

namespace backplane {

class IoPageDispatcher;
class PhysicalMemory;
class RegionManager;

// 16KB language card in slot 0, banked over the $D000-$FFFF ROM.
//
// Pool layout: bank 1 ($D000, 4KB) at 0, bank 2 ($D000, 4KB) at $1000,
// common area ($E000-$FFFF, 8KB) at $2000. The card's regions sit above the
// ROM in precedence and are active only while RAM is read-enabled.
//
// Soft switches $C080-$C08F (reads; writes only disarm write-enable):
//   bit 3       0 = bank 2, 1 = bank 1
//   bits 0,1    equal = read RAM, different = read ROM
//   bit 0 set   write-enable after two consecutive reads of that switch
class LanguageCard final : public Peripheral {
public:
    static constexpr std::string_view kDeviceType = "language_card";
    static constexpr uint32_t kPoolSize = 0x4000;
    static constexpr Addr kBankedBase = 0xD000;
    static constexpr Addr kCommonBase = 0xE000;
    static constexpr uint8_t kFirstSwitch = 0x80;

    static constexpr const char* kBank1Id = "lc_bank1";
    static constexpr const char* kBank2Id = "lc_bank2";
    static constexpr const char* kCommonId = "lc_high";

    static constexpr int kPriority = -10;

    // Registers and maps the card's regions and claims its soft switches.
    // Throws std::invalid_argument if the pool is not 16KB.
    LanguageCard(RegionManager& regions, IoPageDispatcher& io, PhysicalMemory& pool);

    std::string_view name() const override { return "Language Card"; }
    std::string_view device_type() const override { return kDeviceType; }

    void initialize(EventContext&) override {}
    void reset() override;

    bool read_ram() const { return read_ram_; }
    bool write_enabled() const { return write_enabled_; }
    bool bank2_selected() const { return bank2_; }

private:
    void access_switch(uint8_t offset, bool is_read, const BusAccess& access);
    void apply();

    RegionManager& regions_;
    bool read_ram_ = false;
    bool write_enabled_ = false;
    bool bank2_ = true;
    bool prewrite_ = false;
    uint8_t prewrite_switch_ = 0;
};

} // namespace backplane
