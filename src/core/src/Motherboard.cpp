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

#include "backplane/Motherboard.hpp"

#include <stdexcept>
#include <utility>

namespace backplane {

Motherboard::Motherboard(MachineConstants constants, bool debug_features)
    : constants_(std::move(constants))
    , debug_features_(debug_features)
    , regions_(constants_.address_space_bits)
    , bus_(constants_.address_space_bits)
    , context_(scheduler_, signals_, bus_)
    , traps_(constants_.address_space_bits)
    , slots_(io_)
{
    scheduler_.set_event_context(context_);
    bus_.set_clock(&scheduler_);
    traps_.set_slot_manager(&slots_);
    regions_.attach(bus_);
}

Motherboard::~Motherboard() {
    // Pending events may capture peripherals; drop them first
    scheduler_.reset();
    bus_.detach_traps();
    regions_.detach();
}

PhysicalMemory& Motherboard::add_pool(const std::string& id, uint32_t size, std::string name) {
    if (pools_.contains(id)) {
        throw std::invalid_argument("Physical memory pool '" + id + "' already exists");
    }
    auto [it, inserted] = pools_.emplace(id, std::make_unique<PhysicalMemory>(size, std::move(name)));
    return *it->second;
}

PhysicalMemory* Motherboard::pool(const std::string& id) const {
    auto it = pools_.find(id);
    return it == pools_.end() ? nullptr : it->second.get();
}

Peripheral& Motherboard::add_peripheral(std::unique_ptr<Peripheral> peripheral) {
    if (!peripheral) {
        throw std::invalid_argument("Cannot add a null peripheral");
    }
    peripherals_.push_back(std::move(peripheral));
    return *peripherals_.back();
}

Peripheral* Motherboard::find_peripheral(std::string_view device_type) const {
    for (const auto& peripheral : peripherals_) {
        if (peripheral->device_type() == device_type) {
            return peripheral.get();
        }
    }
    return nullptr;
}

void Motherboard::initialize_devices() {
    if (initialized_) {
        throw std::logic_error("Devices have already been initialized");
    }
    initialized_ = true;
    for (auto& peripheral : peripherals_) {
        peripheral->initialize(context_);
    }
}

void Motherboard::reset() {
    for (auto& peripheral : peripherals_) {
        if (peripheral->kind() == PeripheralKind::Motherboard) {
            peripheral->reset();
        }
    }
    slots_.reset();
    signals_.reset();
    bus_.take_trap_cycles();
}

} // namespace backplane
