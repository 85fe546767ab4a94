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

#include "backplane/MonitorTraps.hpp"
#include "backplane/Cpu.hpp"
#include "backplane/MemoryBus.hpp"

namespace backplane {

namespace monitor {

constexpr Addr kStackPage = 0x0100;

Addr emulate_rts(Cpu& cpu, MemoryBus& bus) {
    const uint8_t sp = cpu.sp();
    const uint8_t lo = bus.read8(kStackPage + static_cast<uint8_t>(sp + 1));
    const uint8_t hi = bus.read8(kStackPage + static_cast<uint8_t>(sp + 2));
    cpu.set_sp(static_cast<uint8_t>(sp + 2));
    const uint16_t pushed = static_cast<uint16_t>(lo | (hi << 8));
    return static_cast<uint16_t>(pushed + 1);
}

} // namespace monitor

void install_monitor_traps(TrapRegistry& registry) {
    registry.register_trap(
        monitor::kWait, TrapOperation::Call, "WAIT", TrapCategory::MonitorRom,
        [](Cpu& cpu, MemoryBus& bus, EventContext&) {
            const Cycle cycles = monitor::wait_cycles(cpu.a());
            cpu.set_a(0);
            // Loop exits via SBC/BNE with A = 0: Z and C set, N clear
            cpu.set_p(static_cast<uint8_t>((cpu.p() | 0x03) & ~0x80));
            return TrapResult::redirect(cycles, monitor::emulate_rts(cpu, bus));
        },
        "Monitor delay loop; charges the loop's cycle count without executing it");
}

} // namespace backplane
