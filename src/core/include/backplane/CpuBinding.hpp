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

#include "BusAccess.hpp"
#include "Cpu.hpp"
#include "MemoryBus.hpp"

#include <6502/6502.h>
#include <functional>
#include <utility>

namespace backplane {

using CpuInstructionCallback = std::function<void(uint16_t pc)>;

// Drives an M6502 one cycle at a time through the MemoryBus.
//
// At each instruction boundary the Call trap at PC (if any) runs first; a
// trap that returns an address moves PC there before the opcode is fetched.
// Opcode reads are issued as instruction fetches so page Execute
// permissions apply; all other cycles are ordinary data reads and writes.
class CpuBinding final : public Cpu {
public:
    // Bound on consecutive redirects at one boundary (a trap whose return
    // address is itself trapped)
    static constexpr int kMaxTrapRedirects = 16;

    CpuBinding(M6502& cpu, MemoryBus& bus)
        : cpu_(cpu), bus_(bus) {}

    void execute_cycle() {
        if (M6502_IsAboutToExecute(&cpu_)) {
            for (int i = 0; i < kMaxTrapRedirects; ++i) {
                const TrapResult trap = bus_.try_call_trap(cpu_.pc.w);
                if (!trap.handled || !trap.return_address) {
                    break;
                }
                cpu_.pc.w = static_cast<uint16_t>(*trap.return_address);
            }
            if (instruction_callback_) {
                instruction_callback_(cpu_.pc.w);
            }
        }

        (*cpu_.tfn)(&cpu_);

        const uint16_t addr = cpu_.abus.w;
        if (cpu_.read == M6502ReadType_Opcode) {
            cpu_.dbus = static_cast<uint8_t>(bus_.read(BusAccess::fetch(addr, bus_.now())));
        } else if (cpu_.read) {
            cpu_.dbus = bus_.read8(addr);
        } else {
            bus_.write8(addr, cpu_.dbus);
        }
    }

    void set_instruction_callback(CpuInstructionCallback cb) { instruction_callback_ = std::move(cb); }
    void clear_instruction_callback() { instruction_callback_ = nullptr; }

    uint8_t a() const override { return cpu_.a; }
    uint8_t x() const override { return cpu_.x; }
    uint8_t y() const override { return cpu_.y; }
    uint8_t sp() const override { return cpu_.s.b.l; }
    uint8_t p() const override { return cpu_.p.value; }
    uint16_t pc() const override { return cpu_.pc.w; }

    void set_a(uint8_t value) override { cpu_.a = value; }
    void set_x(uint8_t value) override { cpu_.x = value; }
    void set_y(uint8_t value) override { cpu_.y = value; }
    void set_sp(uint8_t value) override { cpu_.s.b.l = value; }
    void set_p(uint8_t value) override { cpu_.p.value = value; }
    void set_pc(uint16_t value) override { cpu_.pc.w = value; }

private:
    M6502& cpu_;
    MemoryBus& bus_;
    CpuInstructionCallback instruction_callback_;
};

} // namespace backplane
