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

#ifndef BACKPLANE_MACHINE_HPP
#define BACKPLANE_MACHINE_HPP

#include "CpuBinding.hpp"
#include "CpuPolicy.hpp"
#include "MemoryRegion.hpp"
#include "Motherboard.hpp"
#include "SignalBus.hpp"
#include "Types.hpp"

#include <6502/6502.h>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

namespace backplane {

// IRQ device mask for M6502_SetDeviceIRQ. The SignalBus already wire-ORs
// every device, so one bit carries the combined IRQ line.
constexpr uint8_t kIrqDeviceMask = 0x01;

// Called before each instruction executes; return false to stop
using InstructionCallback = std::function<bool(uint16_t pc, uint64_t cycle)>;

// A 6502 on a Motherboard.
//
// Each step() runs one CPU cycle through the bus, then advances the
// scheduler by that cycle plus whatever trap handlers charged, then
// forwards the IRQ line. Machine time is the scheduler's time.
//
// CpuPolicy must provide:
//   - static constexpr const M6502Config* config
//
template<typename CpuPolicy>
class Machine {
public:
    using CpuType = CpuPolicy;

    // Throws std::invalid_argument for a null board
    explicit Machine(std::unique_ptr<Motherboard> board)
        : board_(std::move(board))
        , cpu_binding_(cpu_, checked(board_).bus())
    {
        M6502_Init(&cpu_, CpuPolicy::config);
        board_->attach_cpu(cpu_binding_);
        reset();
    }

    ~Machine() {
        board_->detach_cpu();
        M6502_Destroy(&cpu_);
    }

    // Non-copyable (contains M6502 with pointers)
    Machine(const Machine&) = delete;
    Machine& operator=(const Machine&) = delete;

    // Power-on state for the CPU and devices. Memory and time are kept.
    void reset() {
        M6502_Reset(&cpu_);
        board_->reset();
        ++sequence_;
    }

    // Execute one CPU cycle
    void step() {
        cpu_binding_.execute_cycle();

        const Cycle trap_cycles = board_->bus().take_trap_cycles();
        board_->scheduler().advance(1 + trap_cycles);

        const bool irq = board_->signals().is_asserted(SignalLine::Irq);
        M6502_SetDeviceIRQ(&cpu_, kIrqDeviceMask, irq ? 1 : 0);

        ++sequence_;
    }

    // Execute for at least the given number of cycles, or until the
    // instruction callback asks to stop. Returns false if it stopped early.
    bool run(uint64_t cycles) {
        const Cycle target = cycle_count() + cycles;
        while (cycle_count() < target) {
            if (on_instruction_ && M6502_IsAboutToExecute(&cpu_) && cycle_count() != stopped_at_) {
                if (!on_instruction_(cpu_.pc.w, cycle_count())) {
                    stopped_at_ = cycle_count();  // Resuming must not stop here again
                    return false;
                }
            }
            step();
        }
        return true;
    }

    // Execute one complete instruction (variable cycles)
    // Returns the number of cycles taken
    uint64_t step_instruction() {
        const Cycle start = cycle_count();
        do {
            step();
        } while (!M6502_IsAboutToExecute(&cpu_));
        return cycle_count() - start;
    }

    // Run until the earliest pending event has been dispatched.
    // Returns the cycles taken, or 0 if nothing is scheduled.
    uint64_t run_until_next_event() {
        const auto due = board_->scheduler().peek_next_due();
        if (!due) {
            return 0;
        }
        const Cycle start = cycle_count();
        while (cycle_count() < *due) {
            step();
        }
        board_->scheduler().dispatch_due();
        return cycle_count() - start;
    }

    Motherboard& board() { return *board_; }
    const Motherboard& board() const { return *board_; }

    const M6502& cpu() const { return cpu_; }
    M6502& cpu() { return cpu_; }

    CpuBinding& cpu_binding() { return cpu_binding_; }

    uint64_t cycle_count() const { return board_->scheduler().now(); }

    // Sequence counter (increments on any mutation, for change detection)
    uint64_t sequence() const { return sequence_.load(); }

    // Debug pause/resume for debugger integration
    bool is_paused() const { return paused_.load(); }

    void pause() {
        paused_.store(true);
        ++sequence_;
    }

    void resume() {
        {
            std::lock_guard<std::mutex> lock(debug_mutex_);
            paused_.store(false);
        }
        debug_cv_.notify_all();
        ++sequence_;
    }

    // Block until not paused - call from emulation loop
    void wait_if_paused() {
        if (paused_.load()) {
            std::unique_lock<std::mutex> lock(debug_mutex_);
            debug_cv_.wait(lock, [this] { return !paused_.load(); });
        }
        run_posted();
    }

    // Queue work for the emulation thread (e.g. keyboard input from a
    // service thread). Runs at the next wait_if_paused().
    void post(std::function<void(Machine&)> command) {
        std::lock_guard<std::mutex> lock(post_mutex_);
        posted_.push_back(std::move(command));
    }

    // Run queued work now - call from emulation loop
    void run_posted() {
        std::vector<std::function<void(Machine&)>> commands;
        {
            std::lock_guard<std::mutex> lock(post_mutex_);
            commands.swap(posted_);
        }
        for (auto& command : commands) {
            command(*this);
        }
    }

    uint8_t a() const { return cpu_binding_.a(); }
    uint8_t x() const { return cpu_binding_.x(); }
    uint8_t y() const { return cpu_binding_.y(); }
    uint8_t sp() const { return cpu_binding_.sp(); }
    uint16_t pc() const { return cpu_binding_.pc(); }
    uint8_t p() const { return cpu_binding_.p(); }

    void set_a(uint8_t value) { cpu_binding_.set_a(value); ++sequence_; }
    void set_x(uint8_t value) { cpu_binding_.set_x(value); ++sequence_; }
    void set_y(uint8_t value) { cpu_binding_.set_y(value); ++sequence_; }
    void set_sp(uint8_t value) { cpu_binding_.set_sp(value); ++sequence_; }
    void set_pc(uint16_t value) { cpu_binding_.set_pc(value); ++sequence_; }
    void set_p(uint8_t value) { cpu_binding_.set_p(value); ++sequence_; }

    // Guest-visible accesses (side effects included)
    uint8_t read(uint16_t addr) { return board_->bus().read8(addr); }
    void write(uint16_t addr, uint8_t value) { board_->bus().write8(addr, value); ++sequence_; }

    // Side-effect-free read for debugger inspection
    uint8_t peek(uint16_t addr) { return board_->bus().peek(addr); }

    // Privileged write through the mappings (reaches ROM, not soft switches)
    std::size_t poke(const DebugPrivilege& privilege, uint16_t addr, std::span<const uint8_t> bytes) {
        const std::size_t written = board_->bus().poke(privilege, addr, bytes);
        ++sequence_;
        return written;
    }

    std::vector<MemoryRegionDescriptor> memory_regions() const { return board_->memory_regions(); }

    // Instruction callback
    void set_instruction_callback(InstructionCallback cb) { on_instruction_ = std::move(cb); }
    void clear_callbacks() { on_instruction_ = nullptr; }

    // Execute one complete instruction with optional callback
    // Returns false if callback requested stop, true otherwise
    bool step_instruction_debug() {
        if (on_instruction_) {
            if (!on_instruction_(cpu_.pc.w, cycle_count())) {
                return false;  // Callback requested stop
            }
        }
        step_instruction();
        return true;
    }

private:
    static Motherboard& checked(const std::unique_ptr<Motherboard>& board) {
        if (!board) {
            throw std::invalid_argument("Machine requires a motherboard");
        }
        return *board;
    }

    std::unique_ptr<Motherboard> board_;
    M6502 cpu_{};
    CpuBinding cpu_binding_;
    InstructionCallback on_instruction_;
    Cycle stopped_at_ = ~Cycle{0};

    // Debug pause/resume state (for debugger attach)
    mutable std::mutex debug_mutex_;
    std::condition_variable debug_cv_;
    std::atomic<bool> paused_{false};
    std::atomic<uint64_t> sequence_{0};  // Increments on any mutation

    std::mutex post_mutex_;
    std::vector<std::function<void(Machine&)>> posted_;
};

} // namespace backplane

#endif // BACKPLANE_MACHINE_HPP
