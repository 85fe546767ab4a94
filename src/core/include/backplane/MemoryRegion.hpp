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

#include "BusTarget.hpp"
#include "Flags.hpp"
#include "PageEntry.hpp"
#include "Types.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace backplane {

class PhysicalMemory;

// Flags describing memory region capabilities.
// These are used by debugger clients to discover what operations are available.
enum class RegionFlags : uint8_t {
    None           = 0,
    Readable       = 1 << 0,  // Region can be read (peek/read)
    Writable       = 1 << 1,  // Region can be written
    HasSideEffects = 1 << 2,  // read() may differ from peek() (e.g., clears strobes)
    Populated      = 1 << 3,  // Region has content
    Active         = 1 << 4,  // Currently selected/mapped (for banks)
};

template<>
struct EnableFlagOperators<RegionFlags> : std::true_type {};

// Information about a memory region exposed by a machine.
// Named "Descriptor" to avoid collision with protobuf-generated MemoryRegionInfo.
struct MemoryRegionDescriptor {
    std::string id;         // Region identifier (e.g., "main_ram", "lc_bank1")
    std::string name;       // Human readable name
    Addr base_address;      // Base address in CPU address space
    uint32_t size;          // Size in bytes
    RegionTag tag;
    int priority;
    RegionFlags flags;      // Capability flags
};

// A named, contiguous piece of the machine's address map and the target
// that answers for it. Regions are registered with a RegionManager, which
// turns them into mapping stack entries and finally page table rows.
//
// Lower priority values win where regions overlap.
struct MemoryRegion {
    std::string id;
    std::string name;
    Addr preferred_base = 0;
    uint32_t size = 0;
    RegionTag tag = RegionTag::Unknown;
    PagePerms default_perms = PagePerms::None;
    std::shared_ptr<BusTarget> target;
    PhysicalMemory* physical_memory = nullptr;  // Backing pool, if any (non-owning)
    int priority = 0;
    bool relocatable = false;       // May be moved off preferred_base during placement
    bool supports_overlay = false;  // May be shadowed by higher-precedence regions
    uint32_t device_id = 0;

    TargetCaps caps() const { return target ? target->caps() : TargetCaps::None; }

    Addr end() const { return preferred_base + size; }

    // RAM over the whole of `memory`: read/write/execute, may be overlaid.
    static std::shared_ptr<MemoryRegion> ram(std::string id, std::string name, Addr base,
                                             PhysicalMemory& memory, int priority = 100);

    // ROM over the whole of `memory`: read/execute, fixed at its base.
    static std::shared_ptr<MemoryRegion> rom(std::string id, std::string name, Addr base,
                                             PhysicalMemory& memory, int priority = 0);
};

} // namespace backplane
