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

#include "backplane/BusTarget.hpp"

#include <cstdint>
#include <span>
#include <stdexcept>

namespace backplane {

// ROM over a read-only view of a PhysicalMemory pool.
// Writes are silently ignored; images are loaded with PhysicalMemory::write_physical().
class RomTarget final : public BusTarget {
    std::span<const uint8_t> data_;

public:
    explicit RomTarget(std::span<const uint8_t> data)
        : data_(data)
    {
        if (data_.empty()) {
            throw std::invalid_argument("RomTarget requires a non-empty view");
        }
    }

    TargetCaps caps() const override {
        return TargetCaps::SupportsPeek | TargetCaps::SupportsWide;
    }

    uint8_t read8(Addr physical, const BusAccess&) override {
        return data_[physical % data_.size()];
    }

    void write8(Addr /*physical*/, uint8_t /*value*/, const BusAccess&) override {
        // ROM: writes are ignored
    }

    uint16_t read16(Addr physical, const BusAccess& access) override {
        if (uint64_t{physical} + 2 > data_.size()) {
            return BusTarget::read16(physical, access);
        }
        const uint16_t lo = data_[physical];
        const uint16_t hi = data_[physical + 1];
        return access.is_little_endian() ? static_cast<uint16_t>(lo | (hi << 8))
                                         : static_cast<uint16_t>(hi | (lo << 8));
    }

    void write16(Addr, uint16_t, const BusAccess&) override {}
    void write32(Addr, uint32_t, const BusAccess&) override {}

    std::span<const uint8_t> data() const { return data_; }
};

} // namespace backplane
