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

#ifndef BACKPLANE_REGION_MANAGER_HPP
#define BACKPLANE_REGION_MANAGER_HPP

#include "MappingStack.hpp"
#include "MemoryRegion.hpp"
#include "PageEntry.hpp"
#include "Types.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace backplane {

class MemoryBus;

// The regions requested at bring-up cannot be laid out.
class LayoutError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct RegionPlacement {
    std::string region_id;
    Addr base = 0;
    bool relocated = false;
};

// Active flags and permission overrides of every mapping entry.
struct RegionSnapshot {
    struct Entry {
        std::size_t stack;
        std::string region_id;
        bool active;
        std::optional<PagePerms> perms;
    };
    std::vector<Entry> entries;
};

// Owns the memory regions of a machine and the mapping stacks they are
// mapped through, and derives the bus page table from them.
//
// Where stacks overlap, each page shows the active entry with the lowest
// priority value; ties go to the stack created first. Once a bus is
// attached, every mutation rebuilds just the pages it affects.
class RegionManager {
public:
    explicit RegionManager(unsigned address_space_bits = kDefaultAddressSpaceBits);

    RegionManager(const RegionManager&) = delete;
    RegionManager& operator=(const RegionManager&) = delete;

    // Throws std::invalid_argument for a null region or a duplicate id
    void register_region(std::shared_ptr<MemoryRegion> region);

    // Also removes the region's mappings. Returns false if it was not registered.
    bool unregister_region(const std::string& region_id);

    MemoryRegion* region(const std::string& region_id) const;
    std::size_t region_count() const { return regions_.size(); }

    // Ordered by (priority, registration order)
    std::vector<const MemoryRegion*> regions() const;

    // Regions whose preferred range intersects [start, start + size)
    std::vector<const MemoryRegion*> regions_in_range(Addr start, uint32_t size) const;

    // Stack for exactly this range, created on first use
    MappingStack& mapping_stack(Addr base, uint32_t size);

    std::size_t mapping_stack_count() const { return stacks_.size(); }

    // Push the region onto the stack for its range. A region is mapped at
    // most once; a non-relocatable region only at its preferred base.
    void map_region(const std::string& region_id, bool active = true);
    void map_region_at(const std::string& region_id, Addr base, bool active = true);

    bool is_mapped(const std::string& region_id) const { return mapped_.contains(region_id); }
    std::optional<Addr> mapped_base(const std::string& region_id) const;

    bool activate(const std::string& region_id);
    bool deactivate(const std::string& region_id);

    // Deactivate one region and activate another, or change nothing.
    bool switch_bank(const std::string& from_id, const std::string& to_id);

    bool set_region_perms(const std::string& region_id, PagePerms perms);

    // Bring-up layout of every region not yet mapped, in (priority,
    // registration) order. A region that overlaps one already placed is
    // shadowed there if it supports overlay, moved to the nearest free
    // page-aligned base if it is relocatable (searching downwards first),
    // and otherwise rejected with a LayoutError.
    std::vector<RegionPlacement> place_regions();

    // Install the page table and keep it current from now on
    void attach(MemoryBus& bus);
    void detach() { bus_ = nullptr; }

    void build_page_table(MemoryBus& bus) const;

    RegionSnapshot snapshot() const;

    // Throws std::invalid_argument if the mappings changed shape since the snapshot
    void restore(const RegionSnapshot& snapshot);

    std::vector<MemoryRegionDescriptor> describe() const;

private:
    MappingEntry* mapping_of(const std::string& region_id) const;
    PageEntry resolve_page(uint32_t page) const;
    void refresh(const MappingStack& stack);
    void refresh_pages(MemoryBus& bus, uint32_t first, uint32_t count) const;
    void check_range(Addr base, uint32_t size, const std::string& what) const;

    unsigned address_space_bits_;
    std::vector<std::shared_ptr<MemoryRegion>> regions_;      // Registration order
    std::vector<std::unique_ptr<MappingStack>> stacks_;       // Creation order
    std::map<std::string, MappingStack*> mapped_;
    MemoryBus* bus_ = nullptr;
};

} // namespace backplane

#endif // BACKPLANE_REGION_MANAGER_HPP
