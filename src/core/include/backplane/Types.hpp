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

#ifndef BACKPLANE_TYPES_HPP
#define BACKPLANE_TYPES_HPP

#include <cstddef>
#include <cstdint>

namespace backplane {

// Bus address. Wide enough for any supported address space (up to 32 bits).
using Addr = uint32_t;

// Monotonic machine time. Only the Scheduler advances it.
using Cycle = uint64_t;

// Page geometry shared by the page table, mapping stacks and physical memory.
constexpr unsigned kPageShift = 12;
constexpr uint32_t kPageSize = 1u << kPageShift;  // 4KB
constexpr uint32_t kPageMask = kPageSize - 1;

// Address space limits
constexpr unsigned kDefaultAddressSpaceBits = 16;  // 64KB
constexpr unsigned kMinAddressSpaceBits = kPageShift;
constexpr unsigned kMaxAddressSpaceBits = 32;

// Value observed when nothing drives the data bus (unmapped pages,
// unclaimed soft switches, empty slots).
constexpr uint8_t kFloatingBus = 0xFF;

// Number of bytes in an address space of the given width.
constexpr uint64_t address_space_size(unsigned bits) {
    return uint64_t{1} << bits;
}

constexpr uint32_t page_index(Addr address) {
    return address >> kPageShift;
}

constexpr uint32_t page_offset(Addr address) {
    return address & kPageMask;
}

constexpr bool is_page_aligned(uint64_t value) {
    return (value & kPageMask) == 0;
}

} // namespace backplane

#endif // BACKPLANE_TYPES_HPP
