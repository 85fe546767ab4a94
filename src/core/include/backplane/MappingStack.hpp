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

#ifndef BACKPLANE_MAPPING_STACK_HPP
#define BACKPLANE_MAPPING_STACK_HPP

#include "MemoryRegion.hpp"
#include "PageEntry.hpp"
#include "Types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace backplane {

// One candidate mapping for an address range.
struct MappingEntry {
    const MemoryRegion* region = nullptr;  // Owned by the RegionManager
    bool active = true;
    std::optional<PagePerms> perms;        // Overrides the region's default permissions
    uint32_t physical_offset = 0;          // Physical address seen at the first page
    int priority = 0;
    std::optional<RegionTag> tag;          // Overrides the region's tag

    PagePerms effective_perms() const {
        return perms.value_or(region ? region->default_perms : PagePerms::None);
    }

    RegionTag effective_tag() const {
        return tag.value_or(region ? region->tag : RegionTag::Unmapped);
    }
};

// Ordered set of mappings for one page-aligned range; the topmost active
// entry is the one that is visible. Bank switching is a matter of flipping
// active flags, after which the affected pages are rebuilt.
class MappingStack {
public:
    // Throws std::invalid_argument unless base and size are page aligned and size > 0
    MappingStack(Addr base, uint32_t size);

    Addr base() const { return base_; }
    uint32_t size() const { return size_; }
    uint32_t first_page() const { return page_index(base_); }
    uint32_t page_count() const { return size_ >> kPageShift; }

    bool covers_page(uint32_t page) const {
        return page >= first_page() && page - first_page() < page_count();
    }

    void push(MappingEntry entry);
    std::optional<MappingEntry> pop();

    // Returns false if the region has no entry on this stack
    bool set_active(const std::string& region_id, bool active);
    bool replace(const std::string& region_id, MappingEntry entry);

    // Removes every entry for the region; returns how many were removed
    std::size_t remove_region(const std::string& region_id);

    void clear() { entries_.clear(); }

    bool contains_region(const std::string& region_id) const;

    // Topmost active entry, or nullptr
    const MappingEntry* active_entry() const;

    const std::vector<MappingEntry>& entries() const { return entries_; }
    std::size_t count() const { return entries_.size(); }

    // Page table row for the page `page_offset` pages into the range.
    // Unmapped if nothing is active.
    PageEntry to_page_entry(uint32_t page_offset) const;

private:
    MappingEntry* find(const std::string& region_id);

    Addr base_;
    uint32_t size_;
    std::vector<MappingEntry> entries_;
};

} // namespace backplane

#endif // BACKPLANE_MAPPING_STACK_HPP
