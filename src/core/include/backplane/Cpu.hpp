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

#include <cstdint>

namespace backplane {

// Register file of the CPU driving the bus, as seen by trap handlers and
// tooling. Implemented by the CPU binding; tests provide a plain fake.
class Cpu {
public:
    virtual ~Cpu() = default;

    virtual uint8_t a() const = 0;
    virtual uint8_t x() const = 0;
    virtual uint8_t y() const = 0;
    virtual uint8_t sp() const = 0;
    virtual uint8_t p() const = 0;
    virtual uint16_t pc() const = 0;

    virtual void set_a(uint8_t value) = 0;
    virtual void set_x(uint8_t value) = 0;
    virtual void set_y(uint8_t value) = 0;
    virtual void set_sp(uint8_t value) = 0;
    virtual void set_p(uint8_t value) = 0;
    virtual void set_pc(uint16_t value) = 0;
};

} // namespace backplane
