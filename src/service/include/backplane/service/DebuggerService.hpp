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

#ifndef BACKPLANE_SERVICE_DEBUGGER_SERVICE_HPP
#define BACKPLANE_SERVICE_DEBUGGER_SERVICE_HPP

#include "debugger.grpc.pb.h"
#include "backplane/DebugPrivilege.hpp"
#include "backplane/Machine.hpp"
#include "backplane/service/Conversions.hpp"

#include <grpcpp/grpcpp.h>
#include <algorithm>
#include <cstdint>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace backplane::service {

/// DebuggerControl: execution, memory and breakpoints.
///
/// RPCs run on gRPC threads. Reset, stepping and memory access touch
/// emulation state directly, so they are refused unless the machine is
/// paused; the breakpoint callback is handed to the emulation thread with
/// Machine::post().
template<typename MachineType>
class DebuggerControlServiceImpl final : public DebuggerControl::Service {
public:
    explicit DebuggerControlServiceImpl(MachineType& machine)
        : machine_(machine) {}

    ~DebuggerControlServiceImpl() override {
        machine_.clear_callbacks();
    }

    DebuggerControlServiceImpl(const DebuggerControlServiceImpl&) = delete;
    DebuggerControlServiceImpl& operator=(const DebuggerControlServiceImpl&) = delete;

    grpc::Status GetState(grpc::ServerContext*, const Empty*, ExecutionState* response) override {
        std::lock_guard<std::mutex> lock(mutex_);
        describe(response);
        return grpc::Status::OK;
    }

    grpc::Status Run(grpc::ServerContext*, const Empty*, RunResponse* response) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!machine_.is_paused()) {
            return refuse(response, "already running");
        }
        halt_reason_.clear();
        machine_.resume();
        return succeed(response);
    }

    grpc::Status Stop(grpc::ServerContext*, const Empty*, StopResponse* response) override {
        std::lock_guard<std::mutex> lock(mutex_);
        machine_.pause();
        halt_reason_ = "stopped by debugger";
        describe(response->mutable_state());
        return succeed(response);
    }

    grpc::Status Reset(grpc::ServerContext*, const Empty*, ResetResponse* response) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!machine_.is_paused()) {
            return refuse(response, "machine is running");
        }
        machine_.reset();
        halt_reason_.clear();
        return succeed(response);
    }

    grpc::Status StepInstruction(grpc::ServerContext*, const StepRequest* request,
                                 StepResponse* response) override {
        return step(request->count(), response, true);
    }

    grpc::Status StepCycle(grpc::ServerContext*, const StepRequest* request,
                           StepResponse* response) override {
        return step(request->count(), response, false);
    }

    // Guest-visible: soft switches react as they would to the CPU
    grpc::Status ReadMemory(grpc::ServerContext*, const ReadMemoryRequest* request,
                            ReadMemoryResponse* response) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!machine_.is_paused()) {
            return running_status();
        }
        response->set_data(copy_out(request->address(), request->length(),
                                    [this](uint16_t addr) { return machine_.read(addr); }));
        return grpc::Status::OK;
    }

    grpc::Status PeekMemory(grpc::ServerContext*, const PeekMemoryRequest* request,
                            PeekMemoryResponse* response) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!machine_.is_paused()) {
            return running_status();
        }
        response->set_data(copy_out(request->address(), request->length(),
                                    [this](uint16_t addr) { return machine_.peek(addr); }));
        return grpc::Status::OK;
    }

    grpc::Status WriteMemory(grpc::ServerContext*, const WriteMemoryRequest* request,
                             WriteMemoryResponse* response) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!machine_.is_paused()) {
            return refuse(response, "machine is running");
        }

        const uint32_t base = request->address();
        const std::string& bytes = request->data();
        const uint32_t count = clamp_length(base, static_cast<uint32_t>(bytes.size()));

        if (!request->privileged()) {
            for (uint32_t offset = 0; offset < count; ++offset) {
                machine_.write(static_cast<uint16_t>(base + offset), static_cast<uint8_t>(bytes[offset]));
            }
            response->set_bytes_written(count);
            return succeed(response);
        }

        if (!machine_.board().debug_features_enabled()) {
            return refuse(response, "privileged writes need debug features enabled");
        }
        const std::vector<uint8_t> image(bytes.begin(), bytes.begin() + count);
        const std::size_t accepted = machine_.poke(DebugPrivilege("debugger"), static_cast<uint16_t>(base), image);
        response->set_bytes_written(static_cast<uint32_t>(accepted));
        return succeed(response);
    }

    grpc::Status GetMemoryRegions(grpc::ServerContext*, const GetMemoryRegionsRequest*,
                                  GetMemoryRegionsResponse* response) override {
        std::lock_guard<std::mutex> lock(mutex_);
        response->set_machine_type(machine_.board().constants().type_id);
        for (const MemoryRegionDescriptor& region : machine_.memory_regions()) {
            fill_region_info(region, response->add_regions());
        }
        return grpc::Status::OK;
    }

    grpc::Status AddBreakpoint(grpc::ServerContext*, const AddBreakpointRequest* request,
                               AddBreakpointResponse* response) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (request->address() > 0xFFFF) {
            return refuse(response, "address out of range");
        }
        const uint32_t id = next_breakpoint_id_++;
        breakpoints_.emplace_back(id, static_cast<uint16_t>(request->address()));
        publish_breakpoints();
        response->set_id(id);
        return succeed(response);
    }

    grpc::Status RemoveBreakpoint(grpc::ServerContext*, const RemoveBreakpointRequest* request,
                                  RemoveBreakpointResponse* response) override {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto erased = std::erase_if(breakpoints_, [id = request->id()](const auto& breakpoint) {
            return breakpoint.first == id;
        });
        if (erased == 0) {
            return refuse(response, "no such breakpoint");
        }
        publish_breakpoints();
        return succeed(response);
    }

    grpc::Status ListBreakpoints(grpc::ServerContext*, const Empty*,
                                 ListBreakpointsResponse* response) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, address] : breakpoints_) {
            Breakpoint* breakpoint = response->add_breakpoints();
            breakpoint->set_id(id);
            breakpoint->set_address(address);
        }
        return grpc::Status::OK;
    }

    grpc::Status ClearBreakpoints(grpc::ServerContext*, const Empty*,
                                  ClearBreakpointsResponse* response) override {
        std::lock_guard<std::mutex> lock(mutex_);
        response->set_removed(static_cast<uint32_t>(breakpoints_.size()));
        breakpoints_.clear();
        publish_breakpoints();
        response->set_success(true);
        return grpc::Status::OK;
    }

private:
    // (id, address)
    using BreakpointEntry = std::pair<uint32_t, uint16_t>;

    grpc::Status step(uint32_t requested, StepResponse* response, bool whole_instructions) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!machine_.is_paused()) {
            return refuse(response, "machine is running");
        }

        const uint32_t count = std::max<uint32_t>(requested, 1);
        const Cycle started = machine_.cycle_count();
        for (uint32_t n = 0; n < count; ++n) {
            if (whole_instructions) {
                machine_.step_instruction();
            } else {
                machine_.step();
            }
        }
        halt_reason_.clear();

        // Cycle stepping does not count instructions
        response->set_instructions_executed(whole_instructions ? count : 0);
        response->set_cycles_executed(machine_.cycle_count() - started);
        describe(response->mutable_state());
        return succeed(response);
    }

    // For responses that carry no success flag
    static grpc::Status running_status() {
        return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, "machine is running");
    }

    void describe(ExecutionState* state) const {
        state->set_is_running(!machine_.is_paused());
        state->set_cycle_count(machine_.cycle_count());
        state->set_halt_reason(halt_reason_);
        state->set_sequence(machine_.sequence());
        state->set_pending_events(static_cast<uint32_t>(machine_.board().scheduler().pending_count()));
    }

    // Requests are cut short at the end of the address space
    uint32_t clamp_length(uint32_t address, uint32_t length) const {
        const uint64_t space = machine_.board().bus().address_space_size();
        return address >= space ? 0 : static_cast<uint32_t>(std::min<uint64_t>(length, space - address));
    }

    template<typename Reader>
    std::string copy_out(uint32_t address, uint32_t length, Reader read_byte) {
        const uint32_t count = clamp_length(address, length);
        std::string bytes(count, '\0');
        for (uint32_t offset = 0; offset < count; ++offset) {
            bytes[offset] = static_cast<char>(read_byte(static_cast<uint16_t>(address + offset)));
        }
        return bytes;
    }

    // Hands the current breakpoint set to the emulation thread
    void publish_breakpoints() {
        InstructionCallback callback;
        if (!breakpoints_.empty()) {
            callback = [this](uint16_t pc, uint64_t) {
                std::lock_guard<std::mutex> lock(mutex_);
                const bool hit = std::any_of(breakpoints_.begin(), breakpoints_.end(),
                                             [pc](const BreakpointEntry& entry) { return entry.second == pc; });
                if (hit) {
                    halt_reason_ = "breakpoint at " + hex_address(pc);
                    machine_.pause();
                }
                return !hit;
            };
        }
        machine_.post([callback = std::move(callback)](MachineType& machine) mutable {
            machine.set_instruction_callback(std::move(callback));
        });
    }

    MachineType& machine_;
    std::mutex mutex_;
    std::vector<BreakpointEntry> breakpoints_;
    uint32_t next_breakpoint_id_ = 1;
    std::string halt_reason_;
};

/// Debugger6502: the CPU's programmer-visible registers
template<typename MachineType>
class Debugger6502ServiceImpl final : public Debugger6502::Service {
public:
    explicit Debugger6502ServiceImpl(MachineType& machine)
        : machine_(machine) {}

    Debugger6502ServiceImpl(const Debugger6502ServiceImpl&) = delete;
    Debugger6502ServiceImpl& operator=(const Debugger6502ServiceImpl&) = delete;

    grpc::Status ReadRegisters(grpc::ServerContext*, const Empty*, Registers6502* response) override {
        std::lock_guard<std::mutex> lock(mutex_);
        response->set_a(machine_.a());
        response->set_x(machine_.x());
        response->set_y(machine_.y());
        response->set_sp(machine_.sp());
        response->set_pc(machine_.pc());
        response->set_p(machine_.p());
        return grpc::Status::OK;
    }

    // Only the registers present in the request change
    grpc::Status WriteRegisters(grpc::ServerContext*, const WriteRegisters6502Request* request,
                                WriteRegistersResponse* response) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!machine_.is_paused()) {
            return refuse(response, "machine is running");
        }
        if (request->has_a()) machine_.set_a(static_cast<uint8_t>(request->a()));
        if (request->has_x()) machine_.set_x(static_cast<uint8_t>(request->x()));
        if (request->has_y()) machine_.set_y(static_cast<uint8_t>(request->y()));
        if (request->has_sp()) machine_.set_sp(static_cast<uint8_t>(request->sp()));
        if (request->has_pc()) machine_.set_pc(static_cast<uint16_t>(request->pc()));
        if (request->has_p()) machine_.set_p(static_cast<uint8_t>(request->p()));
        return succeed(response);
    }

private:
    MachineType& machine_;
    std::mutex mutex_;
};

} // namespace backplane::service

#endif // BACKPLANE_SERVICE_DEBUGGER_SERVICE_HPP
