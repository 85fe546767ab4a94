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

#include "backplane/service/Conversions.hpp"

#include <iomanip>
#include <sstream>

namespace backplane::service {

void fill_region_info(const MemoryRegionDescriptor& region, MemoryRegionInfo* info) {
    info->set_id(region.id);
    info->set_name(region.name);
    info->set_base_address(region.base_address);
    info->set_size(region.size);
    info->set_tag(std::string(to_string(region.tag)));
    info->set_priority(region.priority);
    info->set_readable(has_flag(region.flags, RegionFlags::Readable));
    info->set_writable(has_flag(region.flags, RegionFlags::Writable));
    info->set_has_side_effects(has_flag(region.flags, RegionFlags::HasSideEffects));
    info->set_populated(has_flag(region.flags, RegionFlags::Populated));
    info->set_active(has_flag(region.flags, RegionFlags::Active));
}

void fill_trap_description(const TrapInfo& trap, TrapDescription* description) {
    description->set_address(trap.address);
    description->set_operation(std::string(to_string(trap.operation)));
    description->set_name(trap.name);
    description->set_category(std::string(to_string(trap.category)));
    description->set_description(trap.description);
    description->set_enabled(trap.enabled);
    if (trap.slot) {
        description->set_slot(*trap.slot);
    }
    description->set_hits(trap.hits);
}

std::optional<TrapOperation> parse_trap_operation(std::string_view name) {
    for (auto op : {TrapOperation::Read, TrapOperation::Write, TrapOperation::Call}) {
        if (to_string(op) == name) {
            return op;
        }
    }
    return std::nullopt;
}

std::optional<TrapCategory> parse_trap_category(std::string_view name) {
    for (std::size_t i = 0; i < kTrapCategoryCount; ++i) {
        const auto category = static_cast<TrapCategory>(i);
        if (to_string(category) == name) {
            return category;
        }
    }
    return std::nullopt;
}

std::string hex_address(uint32_t address) {
    std::ostringstream oss;
    oss << "$" << std::hex << std::uppercase << std::setw(4) << std::setfill('0') << address;
    return oss.str();
}

} // namespace backplane::service
