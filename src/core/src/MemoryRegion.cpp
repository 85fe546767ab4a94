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

#include "backplane/MemoryRegion.hpp"
#include "backplane/PhysicalMemory.hpp"
#include "backplane/devices/RamTarget.hpp"
#include "backplane/devices/RomTarget.hpp"

#include <utility>

namespace backplane {

std::shared_ptr<MemoryRegion> MemoryRegion::ram(std::string id, std::string name, Addr base,
                                                PhysicalMemory& memory, int priority) {
    auto region = std::make_shared<MemoryRegion>();
    region->id = std::move(id);
    region->name = std::move(name);
    region->preferred_base = base;
    region->size = memory.size();
    region->tag = RegionTag::Ram;
    region->default_perms = PagePerms::All;
    region->target = std::make_shared<RamTarget>(memory.slice(0, memory.size()));
    region->physical_memory = &memory;
    region->priority = priority;
    region->relocatable = false;
    region->supports_overlay = true;
    return region;
}

std::shared_ptr<MemoryRegion> MemoryRegion::rom(std::string id, std::string name, Addr base,
                                                PhysicalMemory& memory, int priority) {
    auto region = std::make_shared<MemoryRegion>();
    region->id = std::move(id);
    region->name = std::move(name);
    region->preferred_base = base;
    region->size = memory.size();
    region->tag = RegionTag::Rom;
    region->default_perms = PagePerms::ReadExecute;
    region->target = std::make_shared<RomTarget>(memory.read_only_slice(0, memory.size()));
    region->physical_memory = &memory;
    region->priority = priority;
    region->relocatable = false;
    region->supports_overlay = false;
    return region;
}

} // namespace backplane
