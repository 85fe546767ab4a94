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

// RAM over a view of a PhysicalMemory pool.
// Physical addresses beyond the view mirror (incomplete address decoding).
class RamTarget final : public BusTarget {
    std::span<uint8_t> data_;

public:
    explicit RamTarget(std::span<uint8_t> data)
        : data_(data)
    {
        if (data_.empty()) {
            throw std::invalid_argument("RamTarget requires a non-empty view");
        }
    }

    TargetCaps caps() const override {
        return TargetCaps::SupportsPeek | TargetCaps::SupportsPoke | TargetCaps::SupportsWide;
    }

    uint8_t read8(Addr physical, const BusAccess&) override {
        return data_[physical % data_.size()];
    }

    void write8(Addr physical, uint8_t value, const BusAccess&) override {
        data_[physical % data_.size()] = value;
    }

    uint16_t read16(Addr physical, const BusAccess& access) override {
        if (!contiguous(physical, 2)) {
            return BusTarget::read16(physical, access);
        }
        const uint16_t lo = data_[physical];
        const uint16_t hi = data_[physical + 1];
        return access.is_little_endian() ? static_cast<uint16_t>(lo | (hi << 8))
                                         : static_cast<uint16_t>(hi | (lo << 8));
    }

    void write16(Addr physical, uint16_t value, const BusAccess& access) override {
        if (!contiguous(physical, 2)) {
            BusTarget::write16(physical, value, access);
            return;
        }
        const uint8_t first = static_cast<uint8_t>(access.is_little_endian() ? value : value >> 8);
        const uint8_t second = static_cast<uint8_t>(access.is_little_endian() ? value >> 8 : value);
        data_[physical] = first;
        data_[physical + 1] = second;
    }

    std::span<uint8_t> data() const { return data_; }

private:
    bool contiguous(Addr physical, uint32_t bytes) const {
        return uint64_t{physical} + bytes <= data_.size();
    }
};

} // namespace backplane
