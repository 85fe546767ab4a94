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

#ifndef BACKPLANE_SERVICE_TRAP_SERVICE_HPP
#define BACKPLANE_SERVICE_TRAP_SERVICE_HPP

#include "debugger.grpc.pb.h"
#include "backplane/TrapRegistry.hpp"
#include "backplane/service/Conversions.hpp"

#include <grpcpp/grpcpp.h>
#include <cstddef>
#include <mutex>
#include <string>

namespace backplane::service {

/// gRPC service implementation for TrapControl.
/// Changes are posted to the emulation thread; listing reads the registry directly.
template<typename MachineType>
class TrapControlServiceImpl final : public TrapControl::Service {
public:
    explicit TrapControlServiceImpl(MachineType& machine)
        : machine_(machine) {}

    // Non-copyable
    TrapControlServiceImpl(const TrapControlServiceImpl&) = delete;
    TrapControlServiceImpl& operator=(const TrapControlServiceImpl&) = delete;

    grpc::Status ListTraps(grpc::ServerContext*, const Empty*, ListTrapsResponse* response) override {
        std::lock_guard<std::mutex> lock(mutex_);

        for (const auto& trap : machine_.board().traps().traps()) {
            fill_trap_description(trap, response->add_traps());
        }
        return grpc::Status::OK;
    }

    grpc::Status SetTrapEnabled(grpc::ServerContext*, const SetTrapEnabledRequest* request,
                                SetTrapEnabledResponse* response) override {
        std::lock_guard<std::mutex> lock(mutex_);

        const auto operation = parse_trap_operation(request->operation());
        if (!operation) {
            return refuse(response, "unknown trap operation '" + request->operation() + "'");
        }

        const Addr address = request->address();
        if (!machine_.board().traps().has_trap(address, *operation)) {
            return refuse(response, "no " + request->operation() + " trap at " + hex_address(address));
        }

        const bool enabled = request->enabled();
        machine_.post([address, op = *operation, enabled](MachineType& machine) {
            machine.board().traps().set_enabled(address, op, enabled);
        });
        response->set_success(true);
        return grpc::Status::OK;
    }

    grpc::Status SetCategoryEnabled(grpc::ServerContext*, const SetCategoryEnabledRequest* request,
                                    SetCategoryEnabledResponse* response) override {
        std::lock_guard<std::mutex> lock(mutex_);

        const auto category = parse_trap_category(request->category());
        if (!category) {
            return refuse(response, "unknown trap category '" + request->category() + "'");
        }

        std::size_t count = 0;
        for (const auto& trap : machine_.board().traps().traps()) {
            if (trap.category == *category) {
                ++count;
            }
        }

        const bool enabled = request->enabled();
        machine_.post([category = *category, enabled](MachineType& machine) {
            machine.board().traps().set_category_enabled(category, enabled);
        });
        response->set_success(true);
        response->set_count(static_cast<uint32_t>(count));
        return grpc::Status::OK;
    }

private:
    MachineType& machine_;
    std::mutex mutex_;
};

} // namespace backplane::service

#endif // BACKPLANE_SERVICE_TRAP_SERVICE_HPP
