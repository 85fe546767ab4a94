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

#include "backplane/SignalBus.hpp"

#include <algorithm>

namespace backplane {

std::string_view to_string(SignalLine line) {
    switch (line) {
        case SignalLine::Irq:    return "IRQ";
        case SignalLine::Nmi:    return "NMI";
        case SignalLine::Reset:  return "RESET";
        case SignalLine::Rdy:    return "RDY";
        case SignalLine::DmaReq: return "DMAREQ";
    }
    return "?";
}

bool SignalBus::assert_line(SignalLine line, uint32_t device_id) {
    auto& holders = asserters(line);
    if (std::find(holders.begin(), holders.end(), device_id) != holders.end()) {
        return false;
    }
    if (line == SignalLine::Nmi && holders.empty()) {
        nmi_edge_ = true;
    }
    holders.push_back(device_id);
    return true;
}

bool SignalBus::clear_line(SignalLine line, uint32_t device_id) {
    auto& holders = asserters(line);
    auto it = std::find(holders.begin(), holders.end(), device_id);
    if (it == holders.end()) {
        return false;
    }
    holders.erase(it);
    return true;
}

bool SignalBus::is_asserted_by(SignalLine line, uint32_t device_id) const {
    const auto& holders = asserters(line);
    return std::find(holders.begin(), holders.end(), device_id) != holders.end();
}

bool SignalBus::consume_nmi_edge() {
    const bool edge = nmi_edge_;
    nmi_edge_ = false;
    return edge;
}

void SignalBus::release_all(uint32_t device_id) {
    for (auto& holders : lines_) {
        std::erase(holders, device_id);
    }
}

void SignalBus::reset() {
    for (auto& holders : lines_) {
        holders.clear();
    }
    nmi_edge_ = false;
}

} // namespace backplane
