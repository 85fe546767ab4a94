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

#include "backplane/BusTarget.hpp"

#include <cstdint>
#include <vector>

namespace backplane {

class IoPageDispatcher;
class SlotManager;

// The 4KB I/O page at $C000:
//   $C000-$C0FF  soft switches (IoPageDispatcher)
//   $C100-$C7FF  slot ROMs; touching $Cnxx selects slot n's expansion ROM
//   $C800-$CFFF  expansion ROM of the selected slot; touching $CFFF deselects it
//
// Side-effect-free accesses never select or deselect.
class IoPageTarget final : public CompositeTarget {
public:
    static constexpr Addr kSlotRomStart = 0x100;
    static constexpr Addr kExpansionRomStart = 0x800;
    static constexpr Addr kExpansionRomSize = 0x800;
    static constexpr Addr kDeselectOffset = 0xFFF;

    IoPageTarget(IoPageDispatcher& dispatcher, SlotManager& slots);

    TargetCaps caps() const override {
        return TargetCaps::SupportsPeek | TargetCaps::SupportsPoke
             | TargetCaps::HasSideEffects | TargetCaps::TimingSensitive;
    }

    BusTarget* resolve_target(Addr offset, AccessIntent intent) override;
    RegionTag sub_region_tag(Addr offset) const override;

private:
    class SoftSwitches final : public BusTarget {
    public:
        explicit SoftSwitches(IoPageDispatcher& dispatcher) : dispatcher_(dispatcher) {}
        TargetCaps caps() const override;
        uint8_t read8(Addr physical, const BusAccess& access) override;
        void write8(Addr physical, uint8_t value, const BusAccess& access) override;
    private:
        IoPageDispatcher& dispatcher_;
    };

    class SlotRomWindow final : public BusTarget {
    public:
        SlotRomWindow(SlotManager& slots, int slot) : slots_(slots), slot_(slot) {}
        TargetCaps caps() const override;
        uint8_t read8(Addr physical, const BusAccess& access) override;
        void write8(Addr physical, uint8_t value, const BusAccess& access) override;
    private:
        SlotManager& slots_;
        int slot_;
    };

    class ExpansionRomWindow final : public BusTarget {
    public:
        explicit ExpansionRomWindow(SlotManager& slots) : slots_(slots) {}
        TargetCaps caps() const override;
        uint8_t read8(Addr physical, const BusAccess& access) override;
        void write8(Addr physical, uint8_t value, const BusAccess& access) override;
    private:
        SlotManager& slots_;
    };

    SlotManager& slots_;
    SoftSwitches switches_;
    std::vector<SlotRomWindow> slot_windows_;  // Slots 1-7
    ExpansionRomWindow expansion_window_;
};

} // namespace backplane
