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

#include "backplane/MappingStack.hpp"

#include <algorithm>
#include <stdexcept>

namespace backplane {

MappingStack::MappingStack(Addr base, uint32_t size)
    : base_(base), size_(size)
{
    if (size == 0 || !is_page_aligned(base) || !is_page_aligned(size)) {
        throw std::invalid_argument(
            "Mapping stack range must be page aligned and non-empty (base " +
            std::to_string(base) + ", size " + std::to_string(size) + ")");
    }
}

void MappingStack::push(MappingEntry entry) {
    if (!entry.region) {
        throw std::invalid_argument("Mapping entry has no region");
    }
    entries_.push_back(entry);
}

std::optional<MappingEntry> MappingStack::pop() {
    if (entries_.empty()) {
        return std::nullopt;
    }
    MappingEntry entry = entries_.back();
    entries_.pop_back();
    return entry;
}

MappingEntry* MappingStack::find(const std::string& region_id) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const MappingEntry& e) { return e.region->id == region_id; });
    return it == entries_.end() ? nullptr : &*it;
}

bool MappingStack::set_active(const std::string& region_id, bool active) {
    MappingEntry* entry = find(region_id);
    if (!entry) {
        return false;
    }
    entry->active = active;
    return true;
}

bool MappingStack::replace(const std::string& region_id, MappingEntry replacement) {
    if (!replacement.region) {
        throw std::invalid_argument("Mapping entry has no region");
    }
    MappingEntry* entry = find(region_id);
    if (!entry) {
        return false;
    }
    *entry = replacement;
    return true;
}

std::size_t MappingStack::remove_region(const std::string& region_id) {
    return std::erase_if(entries_, [&](const MappingEntry& e) { return e.region->id == region_id; });
}

bool MappingStack::contains_region(const std::string& region_id) const {
    return std::any_of(entries_.begin(), entries_.end(),
                       [&](const MappingEntry& e) { return e.region->id == region_id; });
}

const MappingEntry* MappingStack::active_entry() const {
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->active) {
            return &*it;
        }
    }
    return nullptr;
}

PageEntry MappingStack::to_page_entry(uint32_t page_offset) const {
    const MappingEntry* entry = active_entry();
    if (!entry || page_offset >= page_count()) {
        return PageEntry{};
    }
    const MemoryRegion& region = *entry->region;
    PageEntry page;
    page.device_id = region.device_id;
    page.tag = entry->effective_tag();
    page.perms = entry->effective_perms();
    page.caps = region.caps();
    page.target = region.target.get();
    page.physical_base = entry->physical_offset + page_offset * kPageSize;
    return page;
}

} // namespace backplane
