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

#include "backplane/devices/LanguageCard.hpp"
#include "backplane/IoPageDispatcher.hpp"
#include "backplane/MemoryRegion.hpp"
#include "backplane/PhysicalMemory.hpp"
#include "backplane/RegionManager.hpp"
#include "backplane/devices/RamTarget.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace backplane {

namespace {

std::shared_ptr<MemoryRegion> card_region(const char* id, std::string name, Addr base,
                                          PhysicalMemory& pool, uint32_t offset, uint32_t size) {
    auto region = std::make_shared<MemoryRegion>();
    region->id = id;
    region->name = std::move(name);
    region->preferred_base = base;
    region->size = size;
    region->tag = RegionTag::Ram;
    region->default_perms = PagePerms::ReadExecute;
    region->target = std::make_shared<RamTarget>(pool.slice(offset, size));
    region->physical_memory = &pool;
    region->priority = LanguageCard::kPriority;
    region->relocatable = false;
    region->supports_overlay = false;
    return region;
}

} // namespace

LanguageCard::LanguageCard(RegionManager& regions, IoPageDispatcher& io, PhysicalMemory& pool)
    : regions_(regions)
{
    if (pool.size() != kPoolSize) {
        throw std::invalid_argument("Language card needs a 16KB pool, got " +
                                    std::to_string(pool.size()) + " bytes");
    }

    regions_.register_region(card_region(kBank1Id, "Language Card Bank 1", kBankedBase, pool, 0x0000, 0x1000));
    regions_.register_region(card_region(kBank2Id, "Language Card Bank 2", kBankedBase, pool, 0x1000, 0x1000));
    regions_.register_region(card_region(kCommonId, "Language Card High RAM", kCommonBase, pool, 0x2000, 0x2000));
    regions_.map_region(kBank1Id, false);
    regions_.map_region(kBank2Id, false);
    regions_.map_region(kCommonId, false);

    for (uint8_t i = 0; i < 0x10; ++i) {
        io.register_switch(static_cast<uint8_t>(kFirstSwitch + i),
            [this](uint8_t offset, const BusAccess& access) {
                access_switch(offset, true, access);
                return kFloatingBus;
            },
            [this](uint8_t offset, uint8_t, const BusAccess& access) {
                access_switch(offset, false, access);
            });
    }
}

void LanguageCard::access_switch(uint8_t offset, bool is_read, const BusAccess& access) {
    if (access.is_side_effect_free()) {
        return;
    }
    const uint8_t low = offset & 0x0F;

    bank2_ = (low & 0x08) == 0;
    read_ram_ = (low & 0x01) == ((low >> 1) & 0x01);

    if (low & 0x01) {
        // Write-enable needs two reads of the same switch in a row; a write
        // in between disarms it
        if (is_read) {
            if (prewrite_ && prewrite_switch_ == low) {
                write_enabled_ = true;
            }
            prewrite_ = true;
            prewrite_switch_ = low;
        } else {
            prewrite_ = false;
        }
    } else {
        write_enabled_ = false;
        prewrite_ = false;
    }
    apply();
}

void LanguageCard::apply() {
    const std::string selected = bank2_ ? kBank2Id : kBank1Id;
    const std::string other = bank2_ ? kBank1Id : kBank2Id;

    const PagePerms perms = write_enabled_ ? PagePerms::All : PagePerms::ReadExecute;
    regions_.set_region_perms(kBank1Id, perms);
    regions_.set_region_perms(kBank2Id, perms);
    regions_.set_region_perms(kCommonId, perms);

    if (read_ram_) {
        regions_.switch_bank(other, selected);
        regions_.activate(kCommonId);
    } else {
        regions_.deactivate(kBank1Id);
        regions_.deactivate(kBank2Id);
        regions_.deactivate(kCommonId);
    }
}

void LanguageCard::reset() {
    read_ram_ = false;
    write_enabled_ = false;
    bank2_ = true;
    prewrite_ = false;
    apply();
}

} // namespace backplane
