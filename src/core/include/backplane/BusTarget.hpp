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

#ifndef BACKPLANE_BUS_TARGET_HPP
#define BACKPLANE_BUS_TARGET_HPP

#include "BusAccess.hpp"
#include "PageEntry.hpp"
#include "Types.hpp"

#include <cstdint>

namespace backplane {

// A handler bound to one or more pages.
//
// `physical` is the page entry's physical base plus the offset within the page,
// so a target mapped over several pages sees a contiguous physical range.
//
// Targets must leave their observable state untouched when
// access.is_side_effect_free() is true.
//
// The wide handlers default to little/big-endian composition of read8/write8
// calls; targets declaring TargetCaps::SupportsWide should override them.
class BusTarget {
public:
    virtual ~BusTarget() = default;

    virtual TargetCaps caps() const = 0;

    virtual uint8_t read8(Addr physical, const BusAccess& access) = 0;
    virtual void write8(Addr physical, uint8_t value, const BusAccess& access) = 0;

    virtual uint16_t read16(Addr physical, const BusAccess& access) {
        return static_cast<uint16_t>(read_composed(physical, 2, access));
    }

    virtual uint32_t read32(Addr physical, const BusAccess& access) {
        return read_composed(physical, 4, access);
    }

    virtual void write16(Addr physical, uint16_t value, const BusAccess& access) {
        write_composed(physical, 2, value, access);
    }

    virtual void write32(Addr physical, uint32_t value, const BusAccess& access) {
        write_composed(physical, 4, value, access);
    }

    // Overridden by CompositeTarget so the bus can cache the sub-dispatch view
    // without a dynamic_cast on every access.
    virtual CompositeTarget* as_composite() { return nullptr; }

protected:
    uint32_t read_composed(Addr physical, unsigned bytes, const BusAccess& access) {
        uint32_t result = 0;
        for (unsigned i = 0; i < bytes; ++i) {
            const uint32_t byte = read8(physical + i, access);
            const unsigned shift = access.is_little_endian() ? i * 8 : (bytes - 1 - i) * 8;
            result |= byte << shift;
        }
        return result;
    }

    void write_composed(Addr physical, unsigned bytes, uint32_t value, const BusAccess& access) {
        for (unsigned i = 0; i < bytes; ++i) {
            const unsigned shift = access.is_little_endian() ? i * 8 : (bytes - 1 - i) * 8;
            write8(physical + i, static_cast<uint8_t>(value >> shift), access);
        }
    }
};

// A target that owns a whole page but routes each access by offset to a
// finer-grained sub-target (soft switches, slot firmware, expansion ROM...).
// resolve_target() returning nullptr means nothing responds: reads float.
//
// The bus always dispatches composites byte by byte, so declaring
// SupportsWide on a composite is rejected when it is mapped.
class CompositeTarget : public BusTarget {
public:
    virtual BusTarget* resolve_target(Addr offset, AccessIntent intent) = 0;

    virtual RegionTag sub_region_tag(Addr /*offset*/) const { return RegionTag::Io; }

    CompositeTarget* as_composite() override { return this; }

    // Direct calls (outside the bus) route the same way the bus does.
    uint8_t read8(Addr physical, const BusAccess& access) override {
        BusTarget* target = resolve_target(physical & kPageMask, access.intent);
        return target ? target->read8(physical, access) : kFloatingBus;
    }

    void write8(Addr physical, uint8_t value, const BusAccess& access) override {
        if (BusTarget* target = resolve_target(physical & kPageMask, access.intent)) {
            target->write8(physical, value, access);
        }
    }
};

} // namespace backplane

#endif // BACKPLANE_BUS_TARGET_HPP
