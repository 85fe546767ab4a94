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

#include "backplane/devices/SpeakerController.hpp"
#include "backplane/IoPageDispatcher.hpp"

#include <utility>

namespace backplane {

SpeakerController::SpeakerController(IoPageDispatcher& io) {
    for (uint8_t i = 0; i < 0x10; ++i) {
        io.register_switch(static_cast<uint8_t>(kToggleSwitch + i),
            [this](uint8_t, const BusAccess& access) {
                toggle(access);
                return kFloatingBus;
            },
            [this](uint8_t, uint8_t, const BusAccess& access) {
                toggle(access);
            });
    }
}

void SpeakerController::toggle(const BusAccess& access) {
    if (access.is_side_effect_free()) {
        return;
    }
    state_ = !state_;
    ++toggle_count_;
    toggles_.push_back(SpeakerToggle{access.cycle, state_});
}

void SpeakerController::reset() {
    state_ = false;
    toggle_count_ = 0;
    toggles_.clear();
}

std::vector<SpeakerToggle> SpeakerController::take_toggles() {
    return std::exchange(toggles_, {});
}

} // namespace backplane
