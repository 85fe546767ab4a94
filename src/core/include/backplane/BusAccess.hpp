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

#ifndef BACKPLANE_BUS_ACCESS_HPP
#define BACKPLANE_BUS_ACCESS_HPP

#include "Flags.hpp"
#include "Types.hpp"

#include <cstdint>
#include <string_view>

namespace backplane {

// Why an access is being made. Debug intents never have side effects.
enum class AccessIntent : uint8_t {
    DataRead,
    DataWrite,
    InstructionFetch,
    DebugRead,
    DebugWrite,
    DmaRead,
    DmaWrite,
};

// Atomic: a wide access may be handed to the target in one call.
// Decomposed: always split into byte accesses.
enum class AccessMode : uint8_t {
    Atomic,
    Decomposed,
};

enum class AccessFlags : uint8_t {
    None          = 0,
    NoSideEffects = 1 << 0,  // Must not mutate device state
    LittleEndian  = 1 << 1,  // Byte order for wide accesses
    Decompose     = 1 << 2,  // Force byte-wise dispatch
};

template<>
struct EnableFlagOperators<AccessFlags> : std::true_type {};

std::string_view to_string(AccessIntent intent);

// One logical bus transaction.
struct BusAccess {
    Addr address = 0;
    uint32_t value = 0;          // Write data (low `width` bits)
    uint8_t width = 8;           // 8, 16 or 32
    AccessMode mode = AccessMode::Atomic;
    AccessIntent intent = AccessIntent::DataRead;
    uint32_t source_id = 0;      // Originating device (0 = CPU)
    Cycle cycle = 0;
    AccessFlags flags = AccessFlags::LittleEndian;

    bool is_debug() const {
        return intent == AccessIntent::DebugRead || intent == AccessIntent::DebugWrite;
    }

    bool is_side_effect_free() const {
        return is_debug() || has_flag(flags, AccessFlags::NoSideEffects);
    }

    bool is_read() const {
        return intent == AccessIntent::DataRead
            || intent == AccessIntent::InstructionFetch
            || intent == AccessIntent::DebugRead
            || intent == AccessIntent::DmaRead;
    }

    bool is_write() const { return !is_read(); }

    bool is_little_endian() const { return has_flag(flags, AccessFlags::LittleEndian); }

    uint32_t byte_count() const { return width / 8u; }

    // The byte sub-access at address + offset, as used when decomposing.
    BusAccess byte_at(uint32_t offset) const {
        BusAccess sub = *this;
        sub.address = address + offset;
        sub.width = 8;
        sub.mode = AccessMode::Decomposed;
        return sub;
    }

    static BusAccess data_read(Addr address, Cycle cycle = 0, uint8_t width = 8) {
        return make(address, 0, width, AccessIntent::DataRead, cycle);
    }

    static BusAccess data_write(Addr address, uint32_t value, Cycle cycle = 0, uint8_t width = 8) {
        return make(address, value, width, AccessIntent::DataWrite, cycle);
    }

    static BusAccess fetch(Addr address, Cycle cycle = 0) {
        return make(address, 0, 8, AccessIntent::InstructionFetch, cycle);
    }

    static BusAccess debug_read(Addr address, uint8_t width = 8) {
        return make(address, 0, width, AccessIntent::DebugRead, 0,
                    AccessFlags::LittleEndian | AccessFlags::NoSideEffects);
    }

    static BusAccess debug_write(Addr address, uint32_t value, uint8_t width = 8) {
        return make(address, value, width, AccessIntent::DebugWrite, 0,
                    AccessFlags::LittleEndian | AccessFlags::NoSideEffects);
    }

    static BusAccess dma_read(Addr address, uint32_t source_id, Cycle cycle = 0) {
        BusAccess access = make(address, 0, 8, AccessIntent::DmaRead, cycle);
        access.source_id = source_id;
        return access;
    }

    static BusAccess dma_write(Addr address, uint8_t value, uint32_t source_id, Cycle cycle = 0) {
        BusAccess access = make(address, value, 8, AccessIntent::DmaWrite, cycle);
        access.source_id = source_id;
        return access;
    }

private:
    static BusAccess make(Addr address, uint32_t value, uint8_t width, AccessIntent intent,
                          Cycle cycle, AccessFlags flags = AccessFlags::LittleEndian) {
        BusAccess access;
        access.address = address;
        access.value = value;
        access.width = width;
        access.intent = intent;
        access.cycle = cycle;
        access.flags = flags;
        return access;
    }
};

} // namespace backplane

#endif // BACKPLANE_BUS_ACCESS_HPP
