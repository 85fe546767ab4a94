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

#ifndef BACKPLANE_IO_PAGE_DISPATCHER_HPP
#define BACKPLANE_IO_PAGE_DISPATCHER_HPP

#include "Peripheral.hpp"

#include <array>
#include <cstddef>
#include <cstdint>

namespace backplane {

// Routes the 256 soft switch locations ($C000-$C0FF) to device handlers.
// Unclaimed reads float; unclaimed writes are dropped.
class IoPageDispatcher {
public:
    static constexpr std::size_t kSwitchCount = 256;
    static constexpr uint8_t kSlotIoBase = 0x80;
    static constexpr int kSlotIoSlots = 8;  // Slot 0 (language card) to 7

    static constexpr uint8_t slot_io_base(int slot) {
        return static_cast<uint8_t>(kSlotIoBase + slot * kSlotIoSize);
    }

    uint8_t read(uint8_t offset, const BusAccess& access) const;
    void write(uint8_t offset, uint8_t value, const BusAccess& access) const;

    // Each throws std::invalid_argument if the location is already claimed
    // for that direction, or if the handler is empty.
    void register_read(uint8_t offset, SoftSwitchReadHandler handler);
    void register_write(uint8_t offset, SoftSwitchWriteHandler handler);

    // Either handler may be empty.
    void register_switch(uint8_t offset, SoftSwitchReadHandler read, SoftSwitchWriteHandler write);

    void unregister(uint8_t offset);

    // Throws std::out_of_range for slots outside 0-7.
    void install_slot_handlers(int slot, const SlotIoHandlers& handlers);
    void remove_slot_handlers(int slot);

    bool has_read_handler(uint8_t offset) const { return static_cast<bool>(reads_[offset]); }
    bool has_write_handler(uint8_t offset) const { return static_cast<bool>(writes_[offset]); }

private:
    std::array<SoftSwitchReadHandler, kSwitchCount> reads_;
    std::array<SoftSwitchWriteHandler, kSwitchCount> writes_;
};

} // namespace backplane

#endif // BACKPLANE_IO_PAGE_DISPATCHER_HPP
