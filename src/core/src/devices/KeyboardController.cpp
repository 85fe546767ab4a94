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

#include "backplane/devices/KeyboardController.hpp"
#include "backplane/EventContext.hpp"
#include "backplane/IoPageDispatcher.hpp"

#include <algorithm>
#include <stdexcept>

namespace backplane {

KeyboardController::KeyboardController(IoPageDispatcher& io) {
    for (uint8_t i = 0; i < 0x10; ++i) {
        io.register_read(static_cast<uint8_t>(kDataSwitch + i),
            [this](uint8_t, const BusAccess&) { return data(); });

        io.register_switch(static_cast<uint8_t>(kStrobeSwitch + i),
            [this](uint8_t, const BusAccess& access) {
                const uint8_t value = data();
                if (!access.is_side_effect_free()) {
                    strobe_ = false;
                }
                return value;
            },
            [this](uint8_t, uint8_t, const BusAccess& access) {
                if (!access.is_side_effect_free()) {
                    strobe_ = false;
                }
            });
    }
}

void KeyboardController::initialize(EventContext& context) {
    context_ = &context;
}

void KeyboardController::reset() {
    if (context_) {
        for (const auto& handle : typing_) {
            context_->scheduler().cancel(handle);
        }
    }
    typing_.clear();
    latch_ = 0;
    strobe_ = false;
}

void KeyboardController::key_down(uint8_t ascii) {
    // The II+ keyboard only produces upper case
    if (ascii >= 'a' && ascii <= 'z') {
        ascii = static_cast<uint8_t>(ascii - 'a' + 'A');
    }
    latch_ = ascii & 0x7F;
    strobe_ = true;
}

void KeyboardController::type_text(std::string_view text, Cycle interval) {
    if (!context_) {
        throw std::logic_error("Keyboard must be initialized before typing");
    }
    Scheduler& scheduler = context_->scheduler();
    std::erase_if(typing_, [&](const EventHandle& h) { return !scheduler.is_pending(h); });

    Cycle delay = interval;
    for (const char c : text) {
        const uint8_t key = c == '\n' ? uint8_t{0x0D} : static_cast<uint8_t>(c);
        typing_.push_back(scheduler.schedule_after(
            delay, ScheduledEventKind::DeviceTimer, 0,
            [this, key](EventContext&) { key_down(key); },
            device_id()));
        delay += interval;
    }
}

std::size_t KeyboardController::pending_keys() const {
    if (!context_) {
        return 0;
    }
    const Scheduler& scheduler = context_->scheduler();
    return static_cast<std::size_t>(std::count_if(typing_.begin(), typing_.end(),
        [&](const EventHandle& h) { return scheduler.is_pending(h); }));
}

} // namespace backplane
