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

#ifndef BACKPLANE_SERVICE_SERVER_HPP
#define BACKPLANE_SERVICE_SERVER_HPP

#include "backplane/service/DebuggerService.hpp"
#include "backplane/service/KeyboardService.hpp"
#include "backplane/service/TrapService.hpp"

#include <grpcpp/grpcpp.h>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace backplane::service {

// Hosts every Backplane service for one machine on one listening port.
//
// The services exist only while the server runs; they refer to the machine,
// which must outlive the server. Port 0 asks the OS for a free port, which
// port() reports once started.
template<typename MachineType>
class Server {
public:
    explicit Server(MachineType& machine, std::string address = "127.0.0.1", uint16_t port = 50051)
        : machine_(machine)
        , address_(std::move(address))
        , requested_port_(port) {}

    ~Server() { stop(); }

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Non-blocking. Throws std::runtime_error if the port cannot be bound.
    void start() {
        if (grpc_server_) {
            return;
        }

        services_ = std::make_unique<Services>(machine_);
        const std::string endpoint = address_ + ":" + std::to_string(requested_port_);

        int selected_port = 0;
        grpc::ServerBuilder builder;
        builder.AddListeningPort(endpoint, grpc::InsecureServerCredentials(), &selected_port);
        services_->register_with(builder);

        grpc_server_ = builder.BuildAndStart();
        if (!grpc_server_ || selected_port == 0) {
            grpc_server_.reset();
            services_.reset();
            throw std::runtime_error("Cannot start gRPC server on " + endpoint);
        }
        bound_port_ = static_cast<uint16_t>(selected_port);
    }

    // Waits for in-flight calls to finish
    void stop() {
        if (!grpc_server_) {
            return;
        }
        grpc_server_->Shutdown();
        grpc_server_.reset();
        services_.reset();
        bound_port_ = 0;
    }

    bool is_running() const { return grpc_server_ != nullptr; }

    const std::string& address() const { return address_; }

    // The bound port while running, otherwise the requested one
    uint16_t port() const { return is_running() ? bound_port_ : requested_port_; }

private:
    struct Services {
        explicit Services(MachineType& machine)
            : control(machine), cpu(machine), traps(machine), keyboard(machine) {}

        void register_with(grpc::ServerBuilder& builder) {
            builder.RegisterService(&control);
            builder.RegisterService(&cpu);
            builder.RegisterService(&traps);
            builder.RegisterService(&keyboard);
        }

        DebuggerControlServiceImpl<MachineType> control;
        Debugger6502ServiceImpl<MachineType> cpu;
        TrapControlServiceImpl<MachineType> traps;
        KeyboardServiceImpl<MachineType> keyboard;
    };

    MachineType& machine_;
    std::string address_;
    uint16_t requested_port_;
    uint16_t bound_port_ = 0;
    std::unique_ptr<Services> services_;
    std::unique_ptr<grpc::Server> grpc_server_;
};

} // namespace backplane::service

#endif // BACKPLANE_SERVICE_SERVER_HPP
