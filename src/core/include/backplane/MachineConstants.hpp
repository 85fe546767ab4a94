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
#include <optional>
#include <string>

namespace backplane {

// Everything bring-up needs to know about a machine model. Devices get
// these through the Motherboard rather than hard-coding addresses.
struct MachineConstants {
    std::string name;
    std::string type_id;
    unsigned address_space_bits = kDefaultAddressSpaceBits;

    uint32_t min_ram_size = 0;
    uint32_t max_ram_size = 0;
    uint32_t default_ram_size = 0;
    Addr ram_base = 0;

    // Fixed size and base, or (size 0) any page multiple ending at the top
    // of the address space.
    uint32_t boot_rom_size = 0;
    Addr boot_rom_base = 0;

    std::optional<Addr> io_page_base;
    int slot_count = 0;

    uint64_t address_space_size() const { return backplane::address_space_size(address_space_bits); }

    // Where a boot ROM of this size goes
    Addr boot_rom_base_for(uint32_t size) const {
        return boot_rom_size != 0 ? boot_rom_base
                                  : static_cast<Addr>(address_space_size() - size);
    }

    bool has_io_page() const { return io_page_base.has_value(); }

    // Bare 6502 board: RAM from $0000, ROM at the top, no I/O page
    static MachineConstants generic_6502();

    // Apple II+: up to 48KB RAM, 12KB ROM at $D000, I/O page at $C000, slots 1-7
    static MachineConstants apple_ii_plus();
};

} // namespace backplane
