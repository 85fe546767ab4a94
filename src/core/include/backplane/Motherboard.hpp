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

#ifndef BACKPLANE_MOTHERBOARD_HPP
#define BACKPLANE_MOTHERBOARD_HPP

#include "DeviceRegistry.hpp"
#include "EventContext.hpp"
#include "IoPageDispatcher.hpp"
#include "MachineConstants.hpp"
#include "MemoryBus.hpp"
#include "MemoryRegion.hpp"
#include "Peripheral.hpp"
#include "PhysicalMemory.hpp"
#include "RegionManager.hpp"
#include "Scheduler.hpp"
#include "SignalBus.hpp"
#include "SlotManager.hpp"
#include "TrapRegistry.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace backplane {

class Cpu;

// Everything on the board apart from the CPU: physical memory pools, the
// region manager and the bus it feeds, time, control lines, traps, the I/O
// page, the slots and the peripherals themselves.
//
// Construction wires the collaborators together; BringUp fills the board.
// Members are declared so that everything a peripheral refers to outlives it.
class Motherboard {
public:
    explicit Motherboard(MachineConstants constants, bool debug_features = false);
    ~Motherboard();

    Motherboard(const Motherboard&) = delete;
    Motherboard& operator=(const Motherboard&) = delete;

    const MachineConstants& constants() const { return constants_; }
    bool debug_features_enabled() const { return debug_features_; }

    // Throws std::invalid_argument if the id is taken
    PhysicalMemory& add_pool(const std::string& id, uint32_t size, std::string name);
    PhysicalMemory* pool(const std::string& id) const;
    const std::map<std::string, std::unique_ptr<PhysicalMemory>>& pools() const { return pools_; }

    RegionManager& regions() { return regions_; }
    MemoryBus& bus() { return bus_; }
    Scheduler& scheduler() { return scheduler_; }
    SignalBus& signals() { return signals_; }
    EventContext& context() { return context_; }
    TrapRegistry& traps() { return traps_; }
    IoPageDispatcher& io() { return io_; }
    SlotManager& slots() { return slots_; }
    DeviceRegistry& devices() { return devices_; }

    const RegionManager& regions() const { return regions_; }
    const Scheduler& scheduler() const { return scheduler_; }
    const SignalBus& signals() const { return signals_; }
    const TrapRegistry& traps() const { return traps_; }
    const SlotManager& slots() const { return slots_; }
    const DeviceRegistry& devices() const { return devices_; }

    Peripheral& add_peripheral(std::unique_ptr<Peripheral> peripheral);
    const std::vector<std::unique_ptr<Peripheral>>& peripherals() const { return peripherals_; }

    // First peripheral of the given type, or nullptr
    Peripheral* find_peripheral(std::string_view device_type) const;

    template<typename T>
    T* find_peripheral() const {
        return static_cast<T*>(find_peripheral(T::kDeviceType));
    }

    // Runs ScheduledDevice::initialize() on every peripheral.
    // Throws std::logic_error if called twice.
    void initialize_devices();
    bool devices_initialized() const { return initialized_; }

    // Traps fire only once a CPU is attached
    void attach_cpu(Cpu& cpu) { bus_.attach_traps(traps_, cpu, context_); }
    void detach_cpu() { bus_.detach_traps(); }

    // Power-on state for devices and control lines. Memory contents,
    // mappings, scheduled time and traps are left alone.
    void reset();

    std::vector<MemoryRegionDescriptor> memory_regions() const { return regions_.describe(); }

private:
    MachineConstants constants_;
    bool debug_features_;
    std::map<std::string, std::unique_ptr<PhysicalMemory>> pools_;
    RegionManager regions_;
    MemoryBus bus_;
    Scheduler scheduler_;
    SignalBus signals_;
    EventContext context_;
    TrapRegistry traps_;
    IoPageDispatcher io_;
    SlotManager slots_;
    DeviceRegistry devices_;
    std::vector<std::unique_ptr<Peripheral>> peripherals_;
    bool initialized_ = false;
};

} // namespace backplane

#endif // BACKPLANE_MOTHERBOARD_HPP
