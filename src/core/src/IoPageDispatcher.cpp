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

#include "backplane/IoPageDispatcher.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace backplane {

namespace {

std::string switch_name(uint8_t offset) {
    std::ostringstream oss;
    oss << "$C0" << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
        << static_cast<int>(offset);
    return oss.str();
}

void check_slot_io(int slot) {
    if (slot < 0 || slot >= IoPageDispatcher::kSlotIoSlots) {
        throw std::out_of_range("Slot I/O number must be 0-7, was " + std::to_string(slot));
    }
}

} // namespace

void SlotIoHandlers::set(uint8_t offset, SoftSwitchReadHandler read, SoftSwitchWriteHandler write) {
    if (offset >= kSlotIoSize) {
        throw std::out_of_range("Slot I/O offset must be 0-15, was " + std::to_string(offset));
    }
    reads[offset] = std::move(read);
    writes[offset] = std::move(write);
}

uint8_t IoPageDispatcher::read(uint8_t offset, const BusAccess& access) const {
    const auto& handler = reads_[offset];
    return handler ? handler(offset, access) : kFloatingBus;
}

void IoPageDispatcher::write(uint8_t offset, uint8_t value, const BusAccess& access) const {
    if (const auto& handler = writes_[offset]) {
        handler(offset, value, access);
    }
}

void IoPageDispatcher::register_read(uint8_t offset, SoftSwitchReadHandler handler) {
    if (!handler) {
        throw std::invalid_argument("Empty read handler for " + switch_name(offset));
    }
    if (reads_[offset]) {
        throw std::invalid_argument("Read handler already registered at " + switch_name(offset));
    }
    reads_[offset] = std::move(handler);
}

void IoPageDispatcher::register_write(uint8_t offset, SoftSwitchWriteHandler handler) {
    if (!handler) {
        throw std::invalid_argument("Empty write handler for " + switch_name(offset));
    }
    if (writes_[offset]) {
        throw std::invalid_argument("Write handler already registered at " + switch_name(offset));
    }
    writes_[offset] = std::move(handler);
}

void IoPageDispatcher::register_switch(uint8_t offset, SoftSwitchReadHandler read,
                                       SoftSwitchWriteHandler write) {
    if ((read && reads_[offset]) || (write && writes_[offset])) {
        throw std::invalid_argument("Soft switch already registered at " + switch_name(offset));
    }
    if (read) {
        reads_[offset] = std::move(read);
    }
    if (write) {
        writes_[offset] = std::move(write);
    }
}

void IoPageDispatcher::unregister(uint8_t offset) {
    reads_[offset] = nullptr;
    writes_[offset] = nullptr;
}

void IoPageDispatcher::install_slot_handlers(int slot, const SlotIoHandlers& handlers) {
    check_slot_io(slot);
    const uint8_t base = slot_io_base(slot);
    for (uint8_t i = 0; i < kSlotIoSize; ++i) {
        const uint8_t offset = static_cast<uint8_t>(base + i);
        if ((handlers.reads[i] && reads_[offset]) || (handlers.writes[i] && writes_[offset])) {
            throw std::invalid_argument("Slot " + std::to_string(slot) +
                                        " I/O conflicts with handler at " + switch_name(offset));
        }
    }
    for (uint8_t i = 0; i < kSlotIoSize; ++i) {
        const uint8_t offset = static_cast<uint8_t>(base + i);
        if (handlers.reads[i]) {
            reads_[offset] = handlers.reads[i];
        }
        if (handlers.writes[i]) {
            writes_[offset] = handlers.writes[i];
        }
    }
}

void IoPageDispatcher::remove_slot_handlers(int slot) {
    check_slot_io(slot);
    const uint8_t base = slot_io_base(slot);
    for (uint8_t i = 0; i < kSlotIoSize; ++i) {
        unregister(static_cast<uint8_t>(base + i));
    }
}

} // namespace backplane
