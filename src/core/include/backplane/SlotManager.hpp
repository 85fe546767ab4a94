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

#ifndef BACKPLANE_SLOT_MANAGER_HPP
#define BACKPLANE_SLOT_MANAGER_HPP

#include "Types.hpp"

#include <array>
#include <optional>
#include <vector>

namespace backplane {

class BusTarget;
class IoPageDispatcher;
class SlotCard;

constexpr int kFirstSlot = 1;
constexpr int kLastSlot = 7;
constexpr int kSlotCount = kLastSlot - kFirstSlot + 1;

// Expansion slots 1-7 and the shared $C800-$CFFF expansion ROM window.
//
// At most one card's expansion ROM is selected at a time. Cards are owned
// by the Motherboard; the manager only refers to them.
class SlotManager {
public:
    explicit SlotManager(IoPageDispatcher& dispatcher)
        : dispatcher_(dispatcher) {}

    SlotManager(const SlotManager&) = delete;
    SlotManager& operator=(const SlotManager&) = delete;

    // Throws std::out_of_range for a bad slot number and std::logic_error
    // if the slot is occupied.
    void install(int slot, SlotCard& card);

    // Returns false if the slot was empty
    bool remove(int slot);

    SlotCard* card(int slot) const;
    BusTarget* slot_rom(int slot) const;
    BusTarget* expansion_rom(int slot) const;

    // Deselects (and notifies) the previous card before notifying the new one.
    // Selecting the slot that is already selected does nothing.
    void select_expansion_slot(int slot);
    void deselect_expansion_slot();

    // An access to $Cn00-$CnFF selects slot n's expansion ROM
    void handle_slot_rom_access(Addr address);

    std::optional<int> active_expansion_slot() const { return active_; }

    // Expansion ROM of the selected card, or nullptr
    BusTarget* active_expansion_rom() const;

    std::vector<int> occupied_slots() const;

    // Deselect the expansion ROM and reset every installed card
    void reset();

private:
    static void check_slot(int slot);

    IoPageDispatcher& dispatcher_;
    std::array<SlotCard*, kSlotCount> cards_{};
    std::optional<int> active_;
};

} // namespace backplane

#endif // BACKPLANE_SLOT_MANAGER_HPP
