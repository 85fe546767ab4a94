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
#include <catch2/catch_test_macros.hpp>
#include <backplane/Machines.hpp>
#include <backplane/MonitorTraps.hpp>

#include <array>
#include <initializer_list>
#include <stdexcept>
#include <vector>

using namespace backplane;

namespace {

constexpr uint16_t kProgram = 0x0400;

// A generic board whose 4KB ROM is all NOPs and resets to $0400
std::unique_ptr<Nmos6502Machine> make_test_machine() {
    std::vector<uint8_t> rom(0x1000, 0xEA);
    rom[0xFFC] = kProgram & 0xFF;
    rom[0xFFD] = kProgram >> 8;
    const auto bundle = ProvisioningBundle::builder()
        .with_rom_image(ProvisioningBundle::kBootRomImage, std::move(rom))
        .build();
    return make_machine<Nmos6502>(MachineConstants::generic_6502(), bundle);
}

void load(Nmos6502Machine& machine, uint16_t addr, std::initializer_list<uint8_t> bytes) {
    for (uint8_t byte : bytes) {
        machine.write(addr++, byte);
    }
}

} // namespace

TEST_CASE("Machine construction", "[machine][init]") {
    SECTION("A machine starts at cycle zero with a CPU attached") {
        auto machine = make_test_machine();
        REQUIRE(machine->cycle_count() == 0);
        REQUIRE(machine->board().bus().traps_attached());
    }

    SECTION("A null board is rejected") {
        REQUIRE_THROWS_AS(Nmos6502Machine(nullptr), std::invalid_argument);
    }

    SECTION("Failed bring-up is reported") {
        REQUIRE_THROWS_AS(make_machine<Nmos6502>(MachineConstants::generic_6502(),
                                                 ProvisioningBundle::builder().build()),
                          std::runtime_error);
    }

    SECTION("The CMOS variant runs on the same board") {
        std::vector<uint8_t> rom(0x1000, 0xEA);
        const auto bundle = ProvisioningBundle::builder()
            .with_rom_image(ProvisioningBundle::kBootRomImage, std::move(rom))
            .build();
        auto machine = make_machine<Cmos65C02>(MachineConstants::generic_6502(), bundle);
        REQUIRE(machine->cycle_count() == 0);
    }
}

TEST_CASE("Machine step and run", "[machine][execution]") {
    auto machine = make_test_machine();
    load(*machine, kProgram, {0xEA, 0xEA, 0xEA});

    // Reset sequence
    REQUIRE(machine->step_instruction() == 7);
    REQUIRE(machine->pc() == kProgram);

    REQUIRE(machine->step_instruction() == 2);
    REQUIRE(machine->step_instruction() == 2);
    REQUIRE(machine->cycle_count() == 11);

    const uint64_t before = machine->cycle_count();
    REQUIRE(machine->run(4));
    REQUIRE(machine->cycle_count() == before + 4);
}

TEST_CASE("Machine executes through the bus", "[machine][memory]") {
    auto machine = make_test_machine();
    // LDA #$42; STA $0200; NOP
    load(*machine, kProgram, {0xA9, 0x42, 0x8D, 0x00, 0x02, 0xEA});

    machine->step_instruction();
    machine->step_instruction();
    machine->step_instruction();
    REQUIRE(machine->a() == 0x42);
    REQUIRE(machine->read(0x0200) == 0x42);

    SECTION("ROM ignores ordinary writes") {
        machine->write(0xF000, 0x00);
        REQUIRE(machine->peek(0xF000) == 0xEA);
    }

    SECTION("A privileged poke reaches ROM") {
        const std::array<uint8_t, 2> bytes{0x12, 0x34};
        REQUIRE(machine->poke(DebugPrivilege("test"), 0xF000, bytes) == 2);
        REQUIRE(machine->peek(0xF001) == 0x34);
    }
}

TEST_CASE("Machine reset", "[machine][reset]") {
    auto machine = make_test_machine();
    machine->write(0x1000, 0x42);
    machine->run(20);
    const uint64_t time = machine->cycle_count();

    machine->reset();
    REQUIRE(machine->read(0x1000) == 0x42);
    REQUIRE(machine->cycle_count() == time);
    REQUIRE(machine->step_instruction() == 7);
    REQUIRE(machine->pc() == kProgram);
}

TEST_CASE("Machine Call traps", "[machine][traps]") {
    auto machine = make_test_machine();
    load(*machine, 0x0500, {0xEA});
    machine->board().traps().register_trap(
        kProgram, TrapOperation::Call, "divert", TrapCategory::UserDefined,
        [](Cpu& cpu, MemoryBus&, EventContext&) {
            cpu.set_a(0x99);
            return TrapResult::redirect(10, 0x0500);
        });

    machine->step_instruction();  // Reset sequence
    REQUIRE(machine->step_instruction() == 12);
    REQUIRE(machine->a() == 0x99);
    REQUIRE(machine->pc() == 0x0501);
}

TEST_CASE("Machine runs the monitor WAIT trap", "[machine][traps][monitor]") {
    auto machine = make_test_machine();
    install_monitor_traps(machine->board().traps());
    // LDA #$10; JSR WAIT; NOP
    load(*machine, kProgram, {0xA9, 0x10, 0x20, 0xA8, 0xFC, 0xEA});

    machine->step_instruction();  // Reset sequence
    machine->step_instruction();  // LDA
    const uint8_t sp = machine->sp();
    machine->step_instruction();  // JSR
    REQUIRE(machine->pc() == monitor::kWait);

    REQUIRE(machine->step_instruction() == monitor::wait_cycles(0x10) + 2);
    REQUIRE(machine->a() == 0);
    REQUIRE(machine->pc() == kProgram + 6);
    REQUIRE(machine->sp() == sp);
}

TEST_CASE("Machine instruction callback", "[machine][debug]") {
    auto machine = make_test_machine();
    load(*machine, kProgram, {0xEA, 0xEA, 0xEA, 0xEA});

    std::vector<uint16_t> seen;
    machine->set_instruction_callback([&seen](uint16_t pc, uint64_t) {
        seen.push_back(pc);
        return pc != kProgram + 2;
    });

    REQUIRE_FALSE(machine->run(100));
    REQUIRE(machine->pc() == kProgram + 2);

    // Resuming steps over the stop
    REQUIRE(machine->run(4));
    REQUIRE(machine->pc() == kProgram + 4);

    machine->clear_callbacks();
    REQUIRE(machine->run(4));
    REQUIRE(seen.front() == kProgram);
}

TEST_CASE("Machine scheduled events", "[machine][scheduler]") {
    auto machine = make_test_machine();
    Cycle fired_at = 0;
    machine->board().scheduler().schedule_after(
        30, ScheduledEventKind::DeviceTimer, 0,
        [&fired_at](EventContext& ctx) { fired_at = ctx.now(); });

    REQUIRE(machine->run_until_next_event() >= 30);
    REQUIRE(fired_at >= 30);
    REQUIRE(machine->run_until_next_event() == 0);
}

TEST_CASE("Machine posted commands and pause", "[machine][debug]") {
    auto machine = make_test_machine();

    int runs = 0;
    machine->post([&runs](Nmos6502Machine& m) {
        ++runs;
        m.write(0x0300, 0x77);
    });
    REQUIRE(runs == 0);
    machine->wait_if_paused();
    REQUIRE(runs == 1);
    REQUIRE(machine->read(0x0300) == 0x77);

    const uint64_t sequence = machine->sequence();
    machine->pause();
    REQUIRE(machine->is_paused());
    machine->resume();
    REQUIRE_FALSE(machine->is_paused());
    REQUIRE(machine->sequence() > sequence);
}
