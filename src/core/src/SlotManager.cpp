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

#include "backplane/SlotManager.hpp"
#include "backplane/IoPageDispatcher.hpp"
#include "backplane/Peripheral.hpp"

#include <stdexcept>
#include <string>

namespace backplane {

void SlotManager::check_slot(int slot) {
    if (slot < kFirstSlot || slot > kLastSlot) {
        throw std::out_of_range("Slot number must be 1-7, was " + std::to_string(slot));
    }
}

void SlotManager::install(int slot, SlotCard& card) {
    check_slot(slot);
    SlotCard*& occupant = cards_[slot - kFirstSlot];
    if (occupant) {
        throw std::logic_error("Slot " + std::to_string(slot) + " is already occupied by " +
                               std::string(occupant->name()));
    }
    if (const SlotIoHandlers* handlers = card.io_handlers()) {
        dispatcher_.install_slot_handlers(slot, *handlers);
    }
    card.set_slot(slot);
    occupant = &card;
}

bool SlotManager::remove(int slot) {
    check_slot(slot);
    SlotCard*& occupant = cards_[slot - kFirstSlot];
    if (!occupant) {
        return false;
    }
    dispatcher_.remove_slot_handlers(slot);
    if (active_ == slot) {
        occupant->on_expansion_rom_deselected();
        active_.reset();
    }
    occupant = nullptr;
    return true;
}

SlotCard* SlotManager::card(int slot) const {
    check_slot(slot);
    return cards_[slot - kFirstSlot];
}

BusTarget* SlotManager::slot_rom(int slot) const {
    SlotCard* occupant = card(slot);
    return occupant ? occupant->slot_rom() : nullptr;
}

BusTarget* SlotManager::expansion_rom(int slot) const {
    SlotCard* occupant = card(slot);
    return occupant ? occupant->expansion_rom() : nullptr;
}

void SlotManager::select_expansion_slot(int slot) {
    check_slot(slot);
    if (active_ == slot) {
        return;
    }
    deselect_expansion_slot();
    active_ = slot;
    if (SlotCard* occupant = cards_[slot - kFirstSlot]) {
        occupant->on_expansion_rom_selected();
    }
}

void SlotManager::deselect_expansion_slot() {
    if (!active_) {
        return;
    }
    SlotCard* previous = cards_[*active_ - kFirstSlot];
    active_.reset();
    if (previous) {
        previous->on_expansion_rom_deselected();
    }
}

void SlotManager::handle_slot_rom_access(Addr address) {
    // $Cn00-$CnFF: slot number in bits 8-10
    const int slot = static_cast<int>((address >> 8) & 0x07);
    if (slot >= kFirstSlot && slot <= kLastSlot) {
        select_expansion_slot(slot);
    }
}

BusTarget* SlotManager::active_expansion_rom() const {
    if (!active_) {
        return nullptr;
    }
    SlotCard* occupant = cards_[*active_ - kFirstSlot];
    return occupant ? occupant->expansion_rom() : nullptr;
}

std::vector<int> SlotManager::occupied_slots() const {
    std::vector<int> result;
    for (int slot = kFirstSlot; slot <= kLastSlot; ++slot) {
        if (cards_[slot - kFirstSlot]) {
            result.push_back(slot);
        }
    }
    return result;
}

void SlotManager::reset() {
    deselect_expansion_slot();
    for (SlotCard* occupant : cards_) {
        if (occupant) {
            occupant->reset();
        }
    }
}

} // namespace backplane
