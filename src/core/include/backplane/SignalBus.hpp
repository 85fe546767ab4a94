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

#ifndef BACKPLANE_SIGNAL_BUS_HPP
#define BACKPLANE_SIGNAL_BUS_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace backplane {

// Wired-OR control lines shared by the CPU and devices.
enum class SignalLine : uint8_t {
    Irq,
    Nmi,
    Reset,
    Rdy,
    DmaReq,
};

constexpr std::size_t kSignalLineCount = 5;

std::string_view to_string(SignalLine line);

// A line is asserted while at least one device holds it. Assertions are
// tracked per device id so a device can only release what it asserted.
//
// NMI is edge triggered: the transition from no asserters to one or more
// latches an edge which the CPU binding consumes.
class SignalBus {
public:
    // Returns true if this device was not already asserting the line
    bool assert_line(SignalLine line, uint32_t device_id);

    // Returns true if this device was asserting the line
    bool clear_line(SignalLine line, uint32_t device_id);

    bool is_asserted(SignalLine line) const { return !asserters(line).empty(); }

    std::size_t asserter_count(SignalLine line) const { return asserters(line).size(); }

    bool is_asserted_by(SignalLine line, uint32_t device_id) const;

    // True (once) if NMI has gone from released to asserted since the last call
    bool consume_nmi_edge();

    // Release every line held by a device (device removal)
    void release_all(uint32_t device_id);

    void reset();

private:
    const std::vector<uint32_t>& asserters(SignalLine line) const {
        return lines_[static_cast<std::size_t>(line)];
    }

    std::vector<uint32_t>& asserters(SignalLine line) {
        return lines_[static_cast<std::size_t>(line)];
    }

    std::array<std::vector<uint32_t>, kSignalLineCount> lines_;
    bool nmi_edge_ = false;
};

} // namespace backplane

#endif // BACKPLANE_SIGNAL_BUS_HPP
