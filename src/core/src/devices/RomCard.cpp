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

#include "backplane/devices/RomCard.hpp"
#include "backplane/DebugPrivilege.hpp"

#include <stdexcept>
#include <utility>

namespace backplane {

namespace {

std::span<const uint8_t> checked_image(std::span<const uint8_t> image, uint32_t limit,
                                       const std::string& what) {
    if (image.size() > limit) {
        throw std::invalid_argument(what + " is " + std::to_string(image.size()) +
                                    " bytes; at most " + std::to_string(limit) + " fit");
    }
    return image;
}

PhysicalMemory& load(PhysicalMemory& memory, std::span<const uint8_t> image) {
    memory.fill(kFloatingBus);
    memory.write_physical(DebugPrivilege("rom-card"), 0, image);
    return memory;
}

} // namespace

RomCard::RomCard(std::string name, std::span<const uint8_t> slot_rom,
                 std::span<const uint8_t> expansion_rom)
    : name_(std::move(name))
    , slot_rom_(kSlotRomSize, name_ + " slot ROM")
    , expansion_rom_(expansion_rom.empty()
          ? nullptr
          : std::make_unique<PhysicalMemory>(kExpansionRomSize, name_ + " expansion ROM"))
    , slot_rom_target_(load(slot_rom_, checked_image(slot_rom, kSlotRomSize, name_ + " slot ROM"))
                           .read_only_slice(0, kSlotRomSize))
{
    if (slot_rom.empty()) {
        throw std::invalid_argument(name_ + " needs a slot ROM image");
    }
    if (expansion_rom_) {
        load(*expansion_rom_, checked_image(expansion_rom, kExpansionRomSize, name_ + " expansion ROM"));
        expansion_rom_target_.emplace(expansion_rom_->read_only_slice(0, kExpansionRomSize));
    }
}

} // namespace backplane
