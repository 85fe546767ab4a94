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

#include "backplane/TrapRegistry.hpp"
#include "backplane/SlotManager.hpp"

#include <algorithm>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace backplane {

namespace {

// The per-address index is a flat table; beyond this it gets too large to keep
constexpr unsigned kMaxIndexedAddressBits = 24;

std::string describe(Addr address, TrapOperation operation) {
    std::ostringstream oss;
    oss << to_string(operation) << " trap at $" << std::hex << std::uppercase
        << std::setw(4) << std::setfill('0') << address;
    return oss.str();
}

} // namespace

std::string_view to_string(TrapOperation operation) {
    switch (operation) {
        case TrapOperation::Read:  return "Read";
        case TrapOperation::Write: return "Write";
        case TrapOperation::Call:  return "Call";
    }
    return "?";
}

std::string_view to_string(TrapCategory category) {
    switch (category) {
        case TrapCategory::MonitorRom:     return "MonitorRom";
        case TrapCategory::ApplesoftBasic: return "ApplesoftBasic";
        case TrapCategory::Dos33:          return "Dos33";
        case TrapCategory::ProDos:         return "ProDos";
        case TrapCategory::SlotFirmware:   return "SlotFirmware";
        case TrapCategory::Diagnostics:    return "Diagnostics";
        case TrapCategory::UserDefined:    return "UserDefined";
    }
    return "?";
}

TrapRegistry::TrapRegistry(unsigned address_space_bits) {
    if (address_space_bits < kMinAddressSpaceBits || address_space_bits > kMaxAddressSpaceBits) {
        throw std::invalid_argument(
            "Unsupported address space width: " + std::to_string(address_space_bits) + " bits");
    }
    const unsigned indexed_bits = std::min(address_space_bits, kMaxIndexedAddressBits);
    index_.assign(static_cast<std::size_t>(address_space_size(indexed_bits)), 0);
    category_enabled_.fill(true);
}

void TrapRegistry::register_trap(Addr address, TrapOperation operation, std::string name,
                                 TrapCategory category, TrapHandler handler,
                                 std::string description) {
    TrapInfo info;
    info.address = address;
    info.operation = operation;
    info.name = std::move(name);
    info.category = category;
    info.description = std::move(description);
    add(std::move(info), std::move(handler));
}

void TrapRegistry::register_slot_trap(Addr address, int slot, TrapOperation operation,
                                      std::string name, TrapCategory category,
                                      TrapHandler handler, std::string description) {
    if (slot < kFirstSlot || slot > kLastSlot) {
        throw std::invalid_argument("Slot " + std::to_string(slot) + " is out of range");
    }
    TrapInfo info;
    info.address = address;
    info.operation = operation;
    info.name = std::move(name);
    info.category = category;
    info.description = std::move(description);
    info.slot = slot;
    add(std::move(info), std::move(handler));
}

void TrapRegistry::add(TrapInfo info, TrapHandler handler) {
    if (!handler) {
        throw std::invalid_argument("Trap '" + info.name + "' has no handler");
    }
    if (info.address >= index_.size()) {
        throw std::invalid_argument(describe(info.address, info.operation) +
                                    " is outside the trappable address range");
    }
    if (const TrapEntry* existing = find(info.address, info.operation)) {
        throw std::invalid_argument(describe(info.address, info.operation) +
                                    " is already registered as '" + existing->info.name + "'");
    }

    uint16_t& slot_index = index_[info.address];
    if (slot_index == 0) {
        if (trap_slots_.size() >= std::numeric_limits<uint16_t>::max()) {
            throw std::length_error("Too many trapped addresses");
        }
        trap_slots_.push_back(TrapSlot{info.address, {}});
        slot_index = static_cast<uint16_t>(trap_slots_.size());
    }

    info.enabled = is_category_enabled(info.category);
    info.hits = 0;
    auto& entry = trap_slots_[slot_index - 1].entries[static_cast<std::size_t>(info.operation)];
    entry = std::make_unique<TrapEntry>(TrapEntry{std::move(info), std::move(handler)});
    ++count_;
}

bool TrapRegistry::unregister_trap(Addr address, TrapOperation operation) {
    if (address >= index_.size() || index_[address] == 0) {
        return false;
    }
    auto& entry = trap_slots_[index_[address] - 1].entries[static_cast<std::size_t>(operation)];
    if (!entry) {
        return false;
    }
    entry.reset();
    --count_;
    return true;
}

const TrapRegistry::TrapEntry* TrapRegistry::find(Addr address, TrapOperation operation) const {
    if (address >= index_.size()) {
        return nullptr;
    }
    const uint16_t slot_index = index_[address];
    if (slot_index == 0) {
        return nullptr;
    }
    return trap_slots_[slot_index - 1].entries[static_cast<std::size_t>(operation)].get();
}

TrapRegistry::TrapEntry* TrapRegistry::find(Addr address, TrapOperation operation) {
    return const_cast<TrapEntry*>(std::as_const(*this).find(address, operation));
}

TrapResult TrapRegistry::try_execute(Addr address, TrapOperation operation,
                                     Cpu& cpu, MemoryBus& bus, EventContext& context) {
    TrapEntry* entry = find(address, operation);
    if (!entry || !entry->info.enabled) {
        return TrapResult::not_handled();
    }
    if (entry->info.slot) {
        const auto active = slot_manager_ ? slot_manager_->active_expansion_slot() : std::nullopt;
        if (active != entry->info.slot) {
            return TrapResult::not_handled();
        }
    }

    // Run a copy: the handler may unregister its own trap or clear the registry
    const TrapHandler handler = entry->handler;
    TrapResult result = handler(cpu, bus, context);
    if (result.handled) {
        if (TrapEntry* current = find(address, operation)) {
            ++current->info.hits;
        }
    }
    return result;
}

bool TrapRegistry::has_any_in_range(Addr first, uint32_t count, TrapOperation operation) const {
    for (uint32_t i = 0; i < count; ++i) {
        if (find(first + i, operation)) {
            return true;
        }
    }
    return false;
}

bool TrapRegistry::set_enabled(Addr address, TrapOperation operation, bool enabled) {
    TrapEntry* entry = find(address, operation);
    if (!entry) {
        return false;
    }
    entry->info.enabled = enabled;
    return true;
}

std::size_t TrapRegistry::set_category_enabled(TrapCategory category, bool enabled) {
    category_enabled_[static_cast<std::size_t>(category)] = enabled;
    std::size_t affected = 0;
    for (auto& slot : trap_slots_) {
        for (auto& entry : slot.entries) {
            if (entry && entry->info.category == category) {
                entry->info.enabled = enabled;
                ++affected;
            }
        }
    }
    return affected;
}

std::optional<TrapInfo> TrapRegistry::trap_info(Addr address, TrapOperation operation) const {
    if (const TrapEntry* entry = find(address, operation)) {
        return entry->info;
    }
    return std::nullopt;
}

std::vector<TrapInfo> TrapRegistry::traps() const {
    std::vector<TrapInfo> result;
    result.reserve(count_);
    for (const auto& slot : trap_slots_) {
        for (const auto& entry : slot.entries) {
            if (entry) {
                result.push_back(entry->info);
            }
        }
    }
    std::sort(result.begin(), result.end(), [](const TrapInfo& lhs, const TrapInfo& rhs) {
        if (lhs.address != rhs.address) return lhs.address < rhs.address;
        return lhs.operation < rhs.operation;
    });
    return result;
}

void TrapRegistry::clear() {
    std::fill(index_.begin(), index_.end(), uint16_t{0});
    trap_slots_.clear();
    count_ = 0;
}

} // namespace backplane
