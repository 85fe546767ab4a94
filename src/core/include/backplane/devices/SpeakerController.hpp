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
#include "backplane/Types.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace backplane {

class IoPageDispatcher;

// One speaker cone movement
struct SpeakerToggle {
    Cycle cycle;
    bool state;
};

// Apple II speaker: any access to $C030-$C03F flips the cone.
// Toggles are recorded with their cycle for an audio renderer to consume.
class SpeakerController final : public Peripheral {
public:
    static constexpr std::string_view kDeviceType = "speaker";
    static constexpr uint8_t kToggleSwitch = 0x30;

    explicit SpeakerController(IoPageDispatcher& io);

    std::string_view name() const override { return "Speaker"; }
    std::string_view device_type() const override { return kDeviceType; }

    void initialize(EventContext&) override {}
    void reset() override;

    bool state() const { return state_; }
    uint64_t toggle_count() const { return toggle_count_; }

    const std::vector<SpeakerToggle>& toggles() const { return toggles_; }

    // Hand over the toggles recorded so far
    std::vector<SpeakerToggle> take_toggles();

private:
    void toggle(const BusAccess& access);

    bool state_ = false;
    uint64_t toggle_count_ = 0;
    std::vector<SpeakerToggle> toggles_;
};

} // namespace backplane
