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

#include "backplane/devices/IoPage.hpp"
#include "backplane/IoPageDispatcher.hpp"
#include "backplane/SlotManager.hpp"

namespace backplane {

namespace {

constexpr Addr kSlotRomMask = 0xFF;
constexpr Addr kExpansionRomMask = 0x7FF;

} // namespace

IoPageTarget::IoPageTarget(IoPageDispatcher& dispatcher, SlotManager& slots)
    : slots_(slots)
    , switches_(dispatcher)
    , expansion_window_(slots)
{
    slot_windows_.reserve(kSlotCount);
    for (int slot = kFirstSlot; slot <= kLastSlot; ++slot) {
        slot_windows_.emplace_back(slots, slot);
    }
}

BusTarget* IoPageTarget::resolve_target(Addr offset, AccessIntent /*intent*/) {
    offset &= kPageMask;
    if (offset < kSlotRomStart) {
        return &switches_;
    }
    if (offset < kExpansionRomStart) {
        const int slot = static_cast<int>(offset >> 8);
        return slots_.slot_rom(slot) ? &slot_windows_[slot - kFirstSlot] : nullptr;
    }
    // $CFFF must reach the window even with nothing selected so it can deselect
    if (offset == kDeselectOffset || slots_.active_expansion_rom()) {
        return &expansion_window_;
    }
    return nullptr;
}

RegionTag IoPageTarget::sub_region_tag(Addr offset) const {
    return (offset & kPageMask) < kSlotRomStart ? RegionTag::Io : RegionTag::Slot;
}

// Soft switches

TargetCaps IoPageTarget::SoftSwitches::caps() const {
    return TargetCaps::SupportsPeek | TargetCaps::SupportsPoke | TargetCaps::HasSideEffects;
}

uint8_t IoPageTarget::SoftSwitches::read8(Addr physical, const BusAccess& access) {
    return dispatcher_.read(static_cast<uint8_t>(physical), access);
}

void IoPageTarget::SoftSwitches::write8(Addr physical, uint8_t value, const BusAccess& access) {
    dispatcher_.write(static_cast<uint8_t>(physical), value, access);
}

// Slot ROM ($Cn00-$CnFF)

TargetCaps IoPageTarget::SlotRomWindow::caps() const {
    return TargetCaps::SupportsPeek | TargetCaps::HasSideEffects;
}

uint8_t IoPageTarget::SlotRomWindow::read8(Addr physical, const BusAccess& access) {
    if (!access.is_side_effect_free()) {
        slots_.select_expansion_slot(slot_);
    }
    BusTarget* rom = slots_.slot_rom(slot_);
    return rom ? rom->read8(physical & kSlotRomMask, access) : kFloatingBus;
}

void IoPageTarget::SlotRomWindow::write8(Addr physical, uint8_t value, const BusAccess& access) {
    if (!access.is_side_effect_free()) {
        slots_.select_expansion_slot(slot_);
    }
    if (BusTarget* rom = slots_.slot_rom(slot_)) {
        rom->write8(physical & kSlotRomMask, value, access);
    }
}

// Expansion ROM ($C800-$CFFF)

TargetCaps IoPageTarget::ExpansionRomWindow::caps() const {
    return TargetCaps::SupportsPeek | TargetCaps::HasSideEffects;
}

uint8_t IoPageTarget::ExpansionRomWindow::read8(Addr physical, const BusAccess& access) {
    const Addr offset = physical & kExpansionRomMask;
    BusTarget* rom = slots_.active_expansion_rom();
    const uint8_t value = rom ? rom->read8(offset, access) : kFloatingBus;
    if (offset == kExpansionRomMask && !access.is_side_effect_free()) {
        slots_.deselect_expansion_slot();
    }
    return value;
}

void IoPageTarget::ExpansionRomWindow::write8(Addr physical, uint8_t value, const BusAccess& access) {
    const Addr offset = physical & kExpansionRomMask;
    if (BusTarget* rom = slots_.active_expansion_rom()) {
        rom->write8(offset, value, access);
    }
    if (offset == kExpansionRomMask && !access.is_side_effect_free()) {
        slots_.deselect_expansion_slot();
    }
}

} // namespace backplane
