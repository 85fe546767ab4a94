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

#ifndef BACKPLANE_MEMORY_BUS_HPP
#define BACKPLANE_MEMORY_BUS_HPP

#include "BusAccess.hpp"
#include "BusResult.hpp"
#include "BusTarget.hpp"
#include "DebugPrivilege.hpp"
#include "PageEntry.hpp"
#include "TrapRegistry.hpp"
#include "Types.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace backplane {

class Cpu;
class EventContext;
class Scheduler;

// Result of an opcode fetch. If trap.handled and trap.return_address is set,
// the value is meaningless and the CPU must continue at the return address.
struct FetchResult {
    uint8_t value = kFloatingBus;
    TrapResult trap;
};

// Paged address bus.
//
// The address space is divided into 4KB pages; each page has one PageEntry
// naming the target that answers for it. Lookup is a shift and an index.
//
// Guest-visible problems (unmapped pages, missing permissions, composite
// targets with nothing behind an offset) never throw: reads float and
// writes are dropped. Addresses outside the address space are emulator
// bugs and throw std::out_of_range.
class MemoryBus {
public:
    explicit MemoryBus(unsigned address_space_bits = kDefaultAddressSpaceBits);

    MemoryBus(const MemoryBus&) = delete;
    MemoryBus& operator=(const MemoryBus&) = delete;

    unsigned address_space_bits() const { return address_space_bits_; }
    uint64_t address_space_size() const { return backplane::address_space_size(address_space_bits_); }
    uint32_t page_count() const { return static_cast<uint32_t>(pages_.size()); }

    // Page table. A composite target that declares SupportsWide is rejected.
    void map_page(uint32_t index, const PageEntry& entry);

    // Maps `count` consecutive pages; physical_base advances one page per page.
    void map_page_range(uint32_t first, uint32_t count, const PageEntry& first_entry);

    void unmap_page(uint32_t index);
    void unmap_all();

    const PageEntry& page(uint32_t index) const;
    const PageEntry& page_for(Addr address) const { return page(checked_page(address)); }

    // Full access path: traps, permissions, composite dispatch, width rules.
    uint32_t read(const BusAccess& access);
    void write(const BusAccess& access);

    // CPU data cycles, stamped with the current cycle.
    uint8_t read8(Addr address);
    void write8(Addr address, uint8_t value);

    // Opcode fetch. Call traps are consulted before the byte is read.
    FetchResult fetch(Addr address);

    // Runs the Call trap at an instruction address, if any, without reading
    // memory. Used by CPU bindings at instruction boundaries.
    TrapResult try_call_trap(Addr address);

    // As read()/write(), but report why an access did not reach a device.
    BusResult<uint32_t> try_read(const BusAccess& access);
    BusFault try_write(const BusAccess& access);

    // Side-effect-free inspection.
    uint8_t peek(Addr address);
    uint16_t peek16(Addr address);

    // Privileged debugger writes through the page mappings. Only targets
    // that accept pokes are changed. Returns the number of bytes accepted.
    std::size_t poke(const DebugPrivilege& privilege, Addr address, std::span<const uint8_t> bytes);

    // Time source used to stamp convenience accesses
    void set_clock(const Scheduler* scheduler) { clock_ = scheduler; }
    Cycle now() const;

    // Trap interception. Until attached (with a CPU), traps are not consulted.
    void attach_traps(TrapRegistry& traps, Cpu& cpu, EventContext& context);
    void detach_traps();
    bool traps_attached() const { return traps_ != nullptr; }

    // Cycles charged by trap handlers since the last call.
    Cycle take_trap_cycles();

private:
    uint32_t checked_page(Addr address) const;
    void check_access(const BusAccess& access) const;

    bool consults_traps(const BusAccess& access) const;
    bool should_decompose(const BusAccess& access) const;

    // Resolve the target an access reaches, or record why it does not.
    BusTarget* route(const PageEntry& entry, const BusAccess& access, FaultKind& fault) const;

    uint8_t read_byte(const BusAccess& access, BusFault& fault);
    bool write_byte(const BusAccess& access, BusFault& fault);  // False if nothing took the write

    uint32_t read_wide(const BusAccess& access, BusFault& fault);
    void write_wide(const BusAccess& access, BusFault& fault);

    unsigned address_space_bits_;
    std::vector<PageEntry> pages_;
    const Scheduler* clock_ = nullptr;

    TrapRegistry* traps_ = nullptr;
    Cpu* cpu_ = nullptr;
    EventContext* context_ = nullptr;
    Cycle trap_cycles_ = 0;
};

} // namespace backplane

#endif // BACKPLANE_MEMORY_BUS_HPP
