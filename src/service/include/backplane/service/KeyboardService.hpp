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

#ifndef BACKPLANE_SERVICE_KEYBOARD_SERVICE_HPP
#define BACKPLANE_SERVICE_KEYBOARD_SERVICE_HPP

#include "debugger.grpc.pb.h"
#include "backplane/devices/KeyboardController.hpp"

#include <grpcpp/grpcpp.h>
#include <mutex>
#include <string>

namespace backplane::service {

/// gRPC service implementation for keyboard input.
/// Keystrokes are posted to the emulation thread, which owns the scheduler.
template<typename MachineType>
class KeyboardServiceImpl final : public KeyboardService::Service {
public:
    explicit KeyboardServiceImpl(MachineType& machine)
        : machine_(machine)
        , keyboard_(machine.board().template find_peripheral<KeyboardController>()) {}

    // Non-copyable
    KeyboardServiceImpl(const KeyboardServiceImpl&) = delete;
    KeyboardServiceImpl& operator=(const KeyboardServiceImpl&) = delete;

    grpc::Status KeyDown(grpc::ServerContext*, const KeyRequest* request, KeyResponse* response) override {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!keyboard_ || request->ascii() > 0x7F) {
            response->set_accepted(false);
            return grpc::Status::OK;
        }

        const auto key = static_cast<uint8_t>(request->ascii());
        KeyboardController* keyboard = keyboard_;
        machine_.post([keyboard, key](MachineType&) { keyboard->key_down(key); });
        response->set_accepted(true);
        return grpc::Status::OK;
    }

    grpc::Status TypeText(grpc::ServerContext*, const TypeTextRequest* request,
                          TypeTextResponse* response) override {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!keyboard_) {
            response->set_started(false);
            response->set_error("machine has no keyboard");
            return grpc::Status::OK;
        }

        const Cycle interval = request->interval_cycles() != 0
            ? request->interval_cycles()
            : KeyboardController::kDefaultTypingInterval;
        KeyboardController* keyboard = keyboard_;
        machine_.post([keyboard, text = request->text(), interval](MachineType&) {
            keyboard->type_text(text, interval);
        });
        response->set_started(true);
        return grpc::Status::OK;
    }

    grpc::Status GetState(grpc::ServerContext*, const Empty*, KeyboardState* response) override {
        std::lock_guard<std::mutex> lock(mutex_);

        if (keyboard_) {
            response->set_latch(keyboard_->latch());
            response->set_strobe(keyboard_->strobe());
        }
        return grpc::Status::OK;
    }

private:
    MachineType& machine_;
    KeyboardController* keyboard_;
    std::mutex mutex_;
};

} // namespace backplane::service

#endif // BACKPLANE_SERVICE_KEYBOARD_SERVICE_HPP
