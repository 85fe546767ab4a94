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

#ifndef BACKPLANE_SERVICE_CONVERSIONS_HPP
#define BACKPLANE_SERVICE_CONVERSIONS_HPP

#include "debugger.pb.h"
#include "backplane/MemoryRegion.hpp"
#include "backplane/TrapRegistry.hpp"

#include <grpcpp/grpcpp.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace backplane::service {

// Core types to protobuf messages and back

void fill_region_info(const MemoryRegionDescriptor& region, MemoryRegionInfo* info);
void fill_trap_description(const TrapInfo& trap, TrapDescription* description);

// Names as produced by to_string(); nullopt if unrecognised
std::optional<TrapOperation> parse_trap_operation(std::string_view name);
std::optional<TrapCategory> parse_trap_category(std::string_view name);

// "$FCA8"
std::string hex_address(uint32_t address);

// Responses that carry success/error fields report refusals that way and
// keep the transport status OK.
template<typename Response>
grpc::Status refuse(Response* response, std::string error) {
    response->set_success(false);
    response->set_error(std::move(error));
    return grpc::Status::OK;
}

template<typename Response>
grpc::Status succeed(Response* response) {
    response->set_success(true);
    return grpc::Status::OK;
}

} // namespace backplane::service

#endif // BACKPLANE_SERVICE_CONVERSIONS_HPP
