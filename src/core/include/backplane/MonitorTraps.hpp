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

#include "TrapRegistry.hpp"
#include "Types.hpp"

#include <cstdint>

namespace backplane {

class Cpu;
class MemoryBus;

// Apple II monitor ROM entry points replaced by native code.
namespace monitor {

constexpr Addr kWait = 0xFCA8;  // Delay loop: about (26 + 27A + 5A^2) / 2 cycles

// Cycles the monitor WAIT routine burns for a given accumulator (0 means 256)
constexpr Cycle wait_cycles(uint8_t a) {
    const Cycle n = a == 0 ? 256 : a;
    return (26 + 27 * n + 5 * n * n) / 2;
}

// Pop a return address pushed by JSR and continue after it, as RTS does.
// Returns the address execution resumes at.
Addr emulate_rts(Cpu& cpu, MemoryBus& bus);

} // namespace monitor

// Registers the monitor ROM traps in the MonitorRom category.
void install_monitor_traps(TrapRegistry& registry);

} // namespace backplane
