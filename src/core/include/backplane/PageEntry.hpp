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

#ifndef BACKPLANE_PAGE_ENTRY_HPP
#define BACKPLANE_PAGE_ENTRY_HPP

#include "Flags.hpp"
#include "Types.hpp"

#include <cstdint>
#include <string_view>

namespace backplane {

class BusTarget;
class CompositeTarget;

// What kind of thing lives on a page. Informational; dispatch never depends on it.
enum class RegionTag : uint8_t {
    Unknown,
    Ram,
    Rom,
    Io,
    Slot,
    Shadow,
    Unmapped,
    Video,
    ZeroPage,
    Stack,
};

enum class PagePerms : uint8_t {
    None        = 0,
    Read        = 1 << 0,
    Write       = 1 << 1,
    Execute     = 1 << 2,
    ReadWrite   = Read | Write,
    ReadExecute = Read | Execute,
    All         = Read | Write | Execute,
};

template<>
struct EnableFlagOperators<PagePerms> : std::true_type {};

// Capabilities a target declares when it is mapped.
enum class TargetCaps : uint8_t {
    None            = 0,
    SupportsPeek    = 1 << 0,  // Honours side-effect-free reads
    SupportsPoke    = 1 << 1,  // Accepts privileged debug writes
    SupportsWide    = 1 << 2,  // Implements native 16/32-bit handlers
    HasSideEffects  = 1 << 3,  // Ordinary reads may change state
    TimingSensitive = 1 << 4,  // Behaviour depends on access cycle
};

template<>
struct EnableFlagOperators<TargetCaps> : std::true_type {};

std::string_view to_string(RegionTag tag);

// One row of the page table.
struct PageEntry {
    uint32_t device_id = 0;
    RegionTag tag = RegionTag::Unmapped;
    PagePerms perms = PagePerms::None;
    TargetCaps caps = TargetCaps::None;
    BusTarget* target = nullptr;
    CompositeTarget* composite = nullptr;  // Non-null when target sub-dispatches
    Addr physical_base = 0;                // Physical address of the first byte of the page

    bool is_mapped() const { return target != nullptr; }
};

} // namespace backplane

#endif // BACKPLANE_PAGE_ENTRY_HPP
