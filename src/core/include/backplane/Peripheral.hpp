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

#ifndef BACKPLANE_PERIPHERAL_HPP
#define BACKPLANE_PERIPHERAL_HPP

#include "BusAccess.hpp"

#include <array>
#include <cstdint>
#include <functional>
#include <string_view>

namespace backplane {

class BusTarget;
class EventContext;

// Soft switch handlers receive the offset within the 256-byte I/O page.
using SoftSwitchReadHandler = std::function<uint8_t(uint8_t offset, const BusAccess& access)>;
using SoftSwitchWriteHandler = std::function<void(uint8_t offset, uint8_t value, const BusAccess& access)>;

constexpr uint8_t kSlotIoSize = 16;

// The 16 soft switches a slot card decodes ($C080 + slot * 16).
struct SlotIoHandlers {
    std::array<SoftSwitchReadHandler, kSlotIoSize> reads;
    std::array<SoftSwitchWriteHandler, kSlotIoSize> writes;

    void set(uint8_t offset, SoftSwitchReadHandler read, SoftSwitchWriteHandler write);
};

// Anything that takes part in scheduled time.
class ScheduledDevice {
public:
    virtual ~ScheduledDevice() = default;

    virtual std::string_view name() const = 0;

    // Called exactly once, after every device has been wired.
    virtual void initialize(EventContext& context) = 0;
};

enum class PeripheralKind : uint8_t {
    Motherboard,
    SlotCard,
};

// A device created at bring-up. Soft switches and mappings are wired when
// the device is constructed; reset() returns it to power-on state without
// touching that wiring.
class Peripheral : public ScheduledDevice {
public:
    virtual std::string_view device_type() const = 0;

    virtual PeripheralKind kind() const { return PeripheralKind::Motherboard; }

    virtual void reset() = 0;

    uint32_t device_id() const { return device_id_; }
    void set_device_id(uint32_t id) { device_id_ = id; }

private:
    uint32_t device_id_ = 0;
};

// A card plugged into one of the expansion slots.
//
// The slot ROM (256 bytes at $Cn00) is always visible; the expansion ROM
// (2KB at $C800) only while this card's slot is the selected one.
class SlotCard : public Peripheral {
public:
    PeripheralKind kind() const override { return PeripheralKind::SlotCard; }

    int slot() const { return slot_; }
    void set_slot(int slot) { slot_ = slot; }

    virtual const SlotIoHandlers* io_handlers() const { return nullptr; }
    virtual BusTarget* slot_rom() { return nullptr; }
    virtual BusTarget* expansion_rom() { return nullptr; }

    virtual void on_expansion_rom_selected() {}
    virtual void on_expansion_rom_deselected() {}

private:
    int slot_ = 0;
};

} // namespace backplane

#endif // BACKPLANE_PERIPHERAL_HPP
