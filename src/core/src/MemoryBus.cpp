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

#include "backplane/MemoryBus.hpp"
#include "backplane/Scheduler.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace backplane {

namespace {

std::string hex_address(uint64_t address) {
    std::ostringstream oss;
    oss << "$" << std::hex << std::uppercase << std::setw(4) << std::setfill('0') << address;
    return oss.str();
}

TrapOperation trap_operation(const BusAccess& access) {
    return access.is_read() ? TrapOperation::Read : TrapOperation::Write;
}

bool permitted(const PageEntry& entry, const BusAccess& access) {
    if (access.intent == AccessIntent::InstructionFetch) {
        return has_flag(entry.perms, PagePerms::Execute);
    }
    return has_flag(entry.perms, access.is_read() ? PagePerms::Read : PagePerms::Write);
}

void note_fault(BusFault& fault, FaultKind kind, const BusAccess& access, const PageEntry& entry) {
    if (fault.is_fault()) {
        return;  // Report the first byte that failed
    }
    fault.kind = kind;
    fault.address = access.address;
    fault.intent = access.intent;
    fault.device_id = entry.device_id;
    fault.tag = entry.tag;
}

} // namespace

MemoryBus::MemoryBus(unsigned address_space_bits)
    : address_space_bits_(address_space_bits)
{
    if (address_space_bits < kMinAddressSpaceBits || address_space_bits > kMaxAddressSpaceBits) {
        throw std::invalid_argument(
            "Address space must be " + std::to_string(kMinAddressSpaceBits) + "-" +
            std::to_string(kMaxAddressSpaceBits) + " bits, was " +
            std::to_string(address_space_bits));
    }
    pages_.resize(static_cast<std::size_t>(
        backplane::address_space_size(address_space_bits) >> kPageShift));
}

// ---------------------------------------------------------------------------
// Page table
// ---------------------------------------------------------------------------

void MemoryBus::map_page(uint32_t index, const PageEntry& entry) {
    if (index >= pages_.size()) {
        throw std::out_of_range("Page " + std::to_string(index) + " is outside the " +
                                std::to_string(address_space_bits_) + "-bit address space");
    }
    PageEntry installed = entry;
    installed.composite = entry.target ? entry.target->as_composite() : nullptr;
    if (installed.composite && has_flag(installed.caps, TargetCaps::SupportsWide)) {
        throw std::invalid_argument(
            "Composite target on page " + std::to_string(index) +
            " cannot declare SupportsWide: composite pages are always dispatched byte by byte");
    }
    pages_[index] = installed;
}

void MemoryBus::map_page_range(uint32_t first, uint32_t count, const PageEntry& first_entry) {
    if (uint64_t{first} + count > pages_.size()) {
        throw std::out_of_range("Pages " + std::to_string(first) + "+" + std::to_string(count) +
                                " exceed the address space");
    }
    PageEntry entry = first_entry;
    for (uint32_t i = 0; i < count; ++i) {
        map_page(first + i, entry);
        entry.physical_base += kPageSize;
    }
}

void MemoryBus::unmap_page(uint32_t index) {
    if (index >= pages_.size()) {
        throw std::out_of_range("Page " + std::to_string(index) + " is outside the address space");
    }
    pages_[index] = PageEntry{};
}

void MemoryBus::unmap_all() {
    std::fill(pages_.begin(), pages_.end(), PageEntry{});
}

const PageEntry& MemoryBus::page(uint32_t index) const {
    if (index >= pages_.size()) {
        throw std::out_of_range("Page " + std::to_string(index) + " is outside the address space");
    }
    return pages_[index];
}

uint32_t MemoryBus::checked_page(Addr address) const {
    if (address >= address_space_size()) {
        throw std::out_of_range("Address " + hex_address(address) + " is outside the " +
                                std::to_string(address_space_bits_) + "-bit address space");
    }
    return page_index(address);
}

void MemoryBus::check_access(const BusAccess& access) const {
    if (access.width != 8 && access.width != 16 && access.width != 32) {
        throw std::invalid_argument("Bus access width must be 8, 16 or 32 bits, was " +
                                    std::to_string(access.width));
    }
    const uint64_t last = uint64_t{access.address} + access.byte_count() - 1;
    if (last >= address_space_size()) {
        throw std::out_of_range("Access at " + hex_address(access.address) + " (" +
                                std::to_string(access.width) + " bits) runs past the end of the " +
                                std::to_string(address_space_bits_) + "-bit address space");
    }
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------

bool MemoryBus::consults_traps(const BusAccess& access) const {
    if (!traps_ || access.is_side_effect_free()) {
        return false;
    }
    return access.intent == AccessIntent::DataRead
        || access.intent == AccessIntent::InstructionFetch
        || access.intent == AccessIntent::DataWrite;
}

BusTarget* MemoryBus::route(const PageEntry& entry, const BusAccess& access, FaultKind& fault) const {
    if (!entry.target) {
        fault = FaultKind::Unmapped;
        return nullptr;
    }
    // Debugger accesses see through page permissions
    if (!access.is_debug() && !permitted(entry, access)) {
        fault = access.intent == AccessIntent::InstructionFetch ? FaultKind::NoExecute
                                                                : FaultKind::Permission;
        return nullptr;
    }

    BusTarget* target = entry.target;
    TargetCaps caps = entry.caps;
    if (entry.composite) {
        target = entry.composite->resolve_target(page_offset(access.address), access.intent);
        if (!target) {
            fault = FaultKind::Unmapped;
            return nullptr;
        }
        caps = target->caps();
    }

    if (access.is_side_effect_free()) {
        const TargetCaps needed = access.is_read() ? TargetCaps::SupportsPeek : TargetCaps::SupportsPoke;
        if (!has_flag(caps, needed)) {
            return nullptr;
        }
    }
    return target;
}

bool MemoryBus::should_decompose(const BusAccess& access) const {
    const uint32_t bytes = access.byte_count();
    if (page_index(access.address) != page_index(access.address + bytes - 1)) {
        return true;
    }
    if (access.mode == AccessMode::Decomposed || has_flag(access.flags, AccessFlags::Decompose)) {
        return true;
    }

    const PageEntry& entry = pages_[page_index(access.address)];
    if (!entry.target || entry.composite || !has_flag(entry.caps, TargetCaps::SupportsWide)) {
        return true;
    }
    if (consults_traps(access) && traps_->has_any_in_range(access.address, bytes, trap_operation(access))) {
        return true;
    }
    if (access.is_side_effect_free()) {
        const TargetCaps needed = access.is_read() ? TargetCaps::SupportsPeek : TargetCaps::SupportsPoke;
        if (!has_flag(entry.caps, needed)) {
            return true;
        }
    }
    return !access.is_debug() && !permitted(entry, access);
}

uint8_t MemoryBus::read_byte(const BusAccess& access, BusFault& fault) {
    if (consults_traps(access)) {
        const TrapResult trap = traps_->try_execute(access.address, TrapOperation::Read,
                                                    *cpu_, *this, *context_);
        if (trap.handled) {
            trap_cycles_ += trap.cycles;
            return trap.value.value_or(kFloatingBus);
        }
    }

    const PageEntry& entry = pages_[page_index(access.address)];
    FaultKind kind = FaultKind::None;
    BusTarget* target = route(entry, access, kind);
    if (!target) {
        if (kind != FaultKind::None) {
            note_fault(fault, kind, access, entry);
        }
        return kFloatingBus;
    }
    return target->read8(entry.physical_base + page_offset(access.address), access);
}

bool MemoryBus::write_byte(const BusAccess& access, BusFault& fault) {
    if (consults_traps(access)) {
        const TrapResult trap = traps_->try_execute(access.address, TrapOperation::Write,
                                                    *cpu_, *this, *context_);
        if (trap.handled) {
            trap_cycles_ += trap.cycles;
            return true;
        }
    }

    const PageEntry& entry = pages_[page_index(access.address)];
    FaultKind kind = FaultKind::None;
    BusTarget* target = route(entry, access, kind);
    if (!target) {
        if (kind != FaultKind::None) {
            note_fault(fault, kind, access, entry);
        }
        return false;
    }
    target->write8(entry.physical_base + page_offset(access.address),
                   static_cast<uint8_t>(access.value), access);
    return true;
}

uint32_t MemoryBus::read_wide(const BusAccess& access, BusFault& fault) {
    const uint32_t bytes = access.byte_count();
    if (should_decompose(access)) {
        uint32_t result = 0;
        for (uint32_t i = 0; i < bytes; ++i) {
            const uint32_t byte = read_byte(access.byte_at(i), fault);
            const uint32_t shift = access.is_little_endian() ? i * 8 : (bytes - 1 - i) * 8;
            result |= byte << shift;
        }
        return result;
    }

    const PageEntry& entry = pages_[page_index(access.address)];
    const Addr physical = entry.physical_base + page_offset(access.address);
    return bytes == 2 ? entry.target->read16(physical, access)
                      : entry.target->read32(physical, access);
}

void MemoryBus::write_wide(const BusAccess& access, BusFault& fault) {
    const uint32_t bytes = access.byte_count();
    if (should_decompose(access)) {
        for (uint32_t i = 0; i < bytes; ++i) {
            const uint32_t shift = access.is_little_endian() ? i * 8 : (bytes - 1 - i) * 8;
            BusAccess sub = access.byte_at(i);
            sub.value = (access.value >> shift) & 0xFF;
            write_byte(sub, fault);
        }
        return;
    }

    const PageEntry& entry = pages_[page_index(access.address)];
    const Addr physical = entry.physical_base + page_offset(access.address);
    if (bytes == 2) {
        entry.target->write16(physical, static_cast<uint16_t>(access.value), access);
    } else {
        entry.target->write32(physical, access.value, access);
    }
}

// ---------------------------------------------------------------------------
// Public access API
// ---------------------------------------------------------------------------

uint32_t MemoryBus::read(const BusAccess& access) {
    check_access(access);
    BusFault fault;
    return access.width == 8 ? read_byte(access, fault) : read_wide(access, fault);
}

void MemoryBus::write(const BusAccess& access) {
    check_access(access);
    BusFault fault;
    if (access.width == 8) {
        write_byte(access, fault);
    } else {
        write_wide(access, fault);
    }
}

uint8_t MemoryBus::read8(Addr address) {
    checked_page(address);
    BusFault fault;
    return read_byte(BusAccess::data_read(address, now()), fault);
}

void MemoryBus::write8(Addr address, uint8_t value) {
    checked_page(address);
    BusFault fault;
    write_byte(BusAccess::data_write(address, value, now()), fault);
}

FetchResult MemoryBus::fetch(Addr address) {
    FetchResult result;
    result.trap = try_call_trap(address);
    if (result.trap.handled && result.trap.return_address) {
        return result;
    }

    BusFault fault;
    result.value = read_byte(BusAccess::fetch(address, now()), fault);
    return result;
}

TrapResult MemoryBus::try_call_trap(Addr address) {
    checked_page(address);
    if (!consults_traps(BusAccess::fetch(address, now()))) {
        return TrapResult::not_handled();
    }
    TrapResult result = traps_->try_execute(address, TrapOperation::Call, *cpu_, *this, *context_);
    if (result.handled) {
        trap_cycles_ += result.cycles;
    }
    return result;
}

BusResult<uint32_t> MemoryBus::try_read(const BusAccess& access) {
    check_access(access);
    BusResult<uint32_t> result;
    result.value = access.width == 8 ? read_byte(access, result.fault)
                                     : read_wide(access, result.fault);
    return result;
}

BusFault MemoryBus::try_write(const BusAccess& access) {
    check_access(access);
    BusFault fault;
    if (access.width == 8) {
        write_byte(access, fault);
    } else {
        write_wide(access, fault);
    }
    return fault;
}

uint8_t MemoryBus::peek(Addr address) {
    return static_cast<uint8_t>(read(BusAccess::debug_read(address)));
}

uint16_t MemoryBus::peek16(Addr address) {
    return static_cast<uint16_t>(read(BusAccess::debug_read(address, 16)));
}

std::size_t MemoryBus::poke(const DebugPrivilege& /*privilege*/, Addr address,
                            std::span<const uint8_t> bytes) {
    if (bytes.empty()) {
        return 0;
    }
    checked_page(address);
    const uint64_t last = uint64_t{address} + bytes.size() - 1;
    if (last >= address_space_size()) {
        throw std::out_of_range("Poke of " + std::to_string(bytes.size()) + " bytes at " +
                                hex_address(address) + " runs past the end of the " +
                                std::to_string(address_space_bits_) + "-bit address space");
    }

    std::size_t accepted = 0;
    BusFault fault;
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        const BusAccess access = BusAccess::debug_write(static_cast<Addr>(address + i), bytes[i]);
        if (write_byte(access, fault)) {
            ++accepted;
        }
    }
    return accepted;
}

Cycle MemoryBus::now() const {
    return clock_ ? clock_->now() : 0;
}

void MemoryBus::attach_traps(TrapRegistry& traps, Cpu& cpu, EventContext& context) {
    traps_ = &traps;
    cpu_ = &cpu;
    context_ = &context;
}

void MemoryBus::detach_traps() {
    traps_ = nullptr;
    cpu_ = nullptr;
    context_ = nullptr;
}

Cycle MemoryBus::take_trap_cycles() {
    const Cycle cycles = trap_cycles_;
    trap_cycles_ = 0;
    return cycles;
}

} // namespace backplane
