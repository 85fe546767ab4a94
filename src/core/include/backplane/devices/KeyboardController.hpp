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

#include "backplane/Peripheral.hpp"
#include "backplane/Scheduler.hpp"
#include "backplane/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace backplane {

class IoPageDispatcher;

// Apple II keyboard latch.
//
// $C000-$C00F: last key (7-bit ASCII) with bit 7 set while the strobe is up.
// $C010-$C01F: read or write clears the strobe.
class KeyboardController final : public Peripheral {
public:
    static constexpr std::string_view kDeviceType = "keyboard";
    static constexpr uint8_t kDataSwitch = 0x00;
    static constexpr uint8_t kStrobeSwitch = 0x10;
    static constexpr Cycle kDefaultTypingInterval = 20000;

    explicit KeyboardController(IoPageDispatcher& io);

    std::string_view name() const override { return "Keyboard"; }
    std::string_view device_type() const override { return kDeviceType; }

    void initialize(EventContext& context) override;
    void reset() override;

    // A key goes down: latch it and raise the strobe
    void key_down(uint8_t ascii);

    // Schedule keystrokes, one every `interval` cycles starting `interval`
    // cycles from now. Newlines are sent as carriage returns.
    void type_text(std::string_view text, Cycle interval = kDefaultTypingInterval);

    std::size_t pending_keys() const;

    uint8_t latch() const { return latch_; }
    bool strobe() const { return strobe_; }

private:
    uint8_t data() const { return static_cast<uint8_t>(latch_ | (strobe_ ? 0x80 : 0x00)); }

    EventContext* context_ = nullptr;
    uint8_t latch_ = 0;
    bool strobe_ = false;
    std::vector<EventHandle> typing_;
};

} // namespace backplane
