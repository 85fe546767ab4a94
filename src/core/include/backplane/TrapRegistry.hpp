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

#ifndef BACKPLANE_TRAP_REGISTRY_HPP
#define BACKPLANE_TRAP_REGISTRY_HPP

#include "Types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace backplane {

class Cpu;
class EventContext;
class MemoryBus;
class SlotManager;

enum class TrapOperation : uint8_t {
    Read,   // Data read (and operand/opcode reads) at the address
    Write,  // Data write at the address
    Call,   // Opcode fetch at the address: a firmware entry point
};

constexpr std::size_t kTrapOperationCount = 3;

enum class TrapCategory : uint8_t {
    MonitorRom,
    ApplesoftBasic,
    Dos33,
    ProDos,
    SlotFirmware,
    Diagnostics,
    UserDefined,
};

constexpr std::size_t kTrapCategoryCount = 7;

std::string_view to_string(TrapOperation operation);
std::string_view to_string(TrapCategory category);

struct TrapResult {
    bool handled = false;
    Cycle cycles = 0;                     // Cycles the native handler stands in for
    std::optional<Addr> return_address;   // Call traps: where the CPU continues
    std::optional<uint8_t> value;         // Read traps: value placed on the data bus

    static TrapResult not_handled() { return {}; }

    static TrapResult success(Cycle cycles) {
        TrapResult result;
        result.handled = true;
        result.cycles = cycles;
        return result;
    }

    static TrapResult redirect(Cycle cycles, Addr return_address) {
        TrapResult result = success(cycles);
        result.return_address = return_address;
        return result;
    }

    static TrapResult read_value(uint8_t value, Cycle cycles = 0) {
        TrapResult result = success(cycles);
        result.value = value;
        return result;
    }
};

using TrapHandler = std::function<TrapResult(Cpu&, MemoryBus&, EventContext&)>;

struct TrapInfo {
    Addr address = 0;
    TrapOperation operation = TrapOperation::Call;
    std::string name;
    TrapCategory category = TrapCategory::UserDefined;
    std::string description;
    bool enabled = true;
    std::optional<int> slot;  // Only fires while this slot's expansion ROM is selected
    uint64_t hits = 0;
};

// Native replacements for firmware routines, keyed by (address, operation).
//
// Lookup is a single index into a flat per-address table, so an address
// with no traps costs one load and no allocation. Slot-dependent traps are
// checked against the SlotManager when they fire, not when registered,
// because expansion ROM selection changes at run time.
class TrapRegistry {
public:
    explicit TrapRegistry(unsigned address_space_bits = kDefaultAddressSpaceBits);

    TrapRegistry(const TrapRegistry&) = delete;
    TrapRegistry& operator=(const TrapRegistry&) = delete;

    void set_slot_manager(const SlotManager* slots) { slot_manager_ = slots; }

    // Throws std::invalid_argument if the (address, operation) pair is taken,
    // the address is outside the address space, or the handler is empty.
    void register_trap(Addr address, TrapOperation operation, std::string name,
                       TrapCategory category, TrapHandler handler,
                       std::string description = {});

    void register_slot_trap(Addr address, int slot, TrapOperation operation, std::string name,
                            TrapCategory category, TrapHandler handler,
                            std::string description = {});

    bool unregister_trap(Addr address, TrapOperation operation);

    // Runs the handler if a trap is registered, enabled and (for slot traps)
    // its slot's expansion ROM is currently selected.
    TrapResult try_execute(Addr address, TrapOperation operation,
                           Cpu& cpu, MemoryBus& bus, EventContext& context);

    bool has_trap(Addr address, TrapOperation operation) const {
        return find(address, operation) != nullptr;
    }

    // Any trap (enabled or not) on [first, first + count)
    bool has_any_in_range(Addr first, uint32_t count, TrapOperation operation) const;

    bool set_enabled(Addr address, TrapOperation operation, bool enabled);

    // Enables or disables every trap in the category, and remembers the
    // setting for traps registered later. Returns the number of traps in
    // the category.
    std::size_t set_category_enabled(TrapCategory category, bool enabled);

    bool is_category_enabled(TrapCategory category) const {
        return category_enabled_[static_cast<std::size_t>(category)];
    }

    std::optional<TrapInfo> trap_info(Addr address, TrapOperation operation) const;

    // All traps ordered by address, then operation
    std::vector<TrapInfo> traps() const;

    std::size_t count() const { return count_; }

    void clear();

private:
    struct TrapEntry {
        TrapInfo info;
        TrapHandler handler;
    };

    struct TrapSlot {
        Addr address;
        std::array<std::unique_ptr<TrapEntry>, kTrapOperationCount> entries;
    };

    const TrapEntry* find(Addr address, TrapOperation operation) const;
    TrapEntry* find(Addr address, TrapOperation operation);
    void add(TrapInfo info, TrapHandler handler);

    std::vector<uint16_t> index_;  // address -> trap_slots_ index + 1 (0 = none)
    std::vector<TrapSlot> trap_slots_;
    std::array<bool, kTrapCategoryCount> category_enabled_;
    std::size_t count_ = 0;
    const SlotManager* slot_manager_ = nullptr;
};

} // namespace backplane

#endif // BACKPLANE_TRAP_REGISTRY_HPP
