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

#include "backplane/RegionManager.hpp"
#include "backplane/MemoryBus.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace backplane {

namespace {

std::string hex(uint64_t value) {
    std::ostringstream oss;
    oss << "$" << std::hex << std::uppercase << std::setw(4) << std::setfill('0') << value;
    return oss.str();
}

struct PlacedRange {
    uint64_t begin;
    uint64_t end;
    std::string region_id;
};

const PlacedRange* first_overlap(const std::vector<PlacedRange>& placed, uint64_t begin, uint64_t end) {
    for (const auto& range : placed) {
        if (begin < range.end && range.begin < end) {
            return &range;
        }
    }
    return nullptr;
}

} // namespace

RegionManager::RegionManager(unsigned address_space_bits)
    : address_space_bits_(address_space_bits)
{
    if (address_space_bits < kMinAddressSpaceBits || address_space_bits > kMaxAddressSpaceBits) {
        throw std::invalid_argument(
            "Unsupported address space width: " + std::to_string(address_space_bits) + " bits");
    }
}

// ---------------------------------------------------------------------------
// Regions
// ---------------------------------------------------------------------------

void RegionManager::register_region(std::shared_ptr<MemoryRegion> region) {
    if (!region) {
        throw std::invalid_argument("Cannot register a null region");
    }
    if (this->region(region->id)) {
        throw std::invalid_argument("A region with id '" + region->id + "' already exists");
    }
    regions_.push_back(std::move(region));
}

bool RegionManager::unregister_region(const std::string& region_id) {
    auto it = std::find_if(regions_.begin(), regions_.end(),
                           [&](const auto& r) { return r->id == region_id; });
    if (it == regions_.end()) {
        return false;
    }
    if (auto mapped = mapped_.find(region_id); mapped != mapped_.end()) {
        MappingStack* stack = mapped->second;
        stack->remove_region(region_id);
        mapped_.erase(mapped);
        refresh(*stack);
    }
    regions_.erase(it);
    return true;
}

MemoryRegion* RegionManager::region(const std::string& region_id) const {
    for (const auto& r : regions_) {
        if (r->id == region_id) {
            return r.get();
        }
    }
    return nullptr;
}

std::vector<const MemoryRegion*> RegionManager::regions() const {
    std::vector<const MemoryRegion*> result;
    result.reserve(regions_.size());
    for (const auto& r : regions_) {
        result.push_back(r.get());
    }
    std::stable_sort(result.begin(), result.end(), [](const MemoryRegion* lhs, const MemoryRegion* rhs) {
        return lhs->priority < rhs->priority;
    });
    return result;
}

std::vector<const MemoryRegion*> RegionManager::regions_in_range(Addr start, uint32_t size) const {
    const uint64_t end = uint64_t{start} + size;
    std::vector<const MemoryRegion*> result;
    for (const MemoryRegion* r : regions()) {
        const uint64_t region_end = uint64_t{r->preferred_base} + r->size;
        if (r->preferred_base < end && region_end > start) {
            result.push_back(r);
        }
    }
    return result;
}

// ---------------------------------------------------------------------------
// Mapping stacks
// ---------------------------------------------------------------------------

void RegionManager::check_range(Addr base, uint32_t size, const std::string& what) const {
    if (uint64_t{base} + size > address_space_size(address_space_bits_)) {
        throw std::invalid_argument(what + " at " + hex(base) + " (" + std::to_string(size) +
                                    " bytes) exceeds the " + std::to_string(address_space_bits_) +
                                    "-bit address space");
    }
}

MappingStack& RegionManager::mapping_stack(Addr base, uint32_t size) {
    for (const auto& stack : stacks_) {
        if (stack->base() == base && stack->size() == size) {
            return *stack;
        }
    }
    check_range(base, size, "Mapping stack");
    stacks_.push_back(std::make_unique<MappingStack>(base, size));
    return *stacks_.back();
}

void RegionManager::map_region(const std::string& region_id, bool active) {
    const MemoryRegion* r = region(region_id);
    if (!r) {
        throw std::invalid_argument("Unknown region '" + region_id + "'");
    }
    map_region_at(region_id, r->preferred_base, active);
}

void RegionManager::map_region_at(const std::string& region_id, Addr base, bool active) {
    const MemoryRegion* r = region(region_id);
    if (!r) {
        throw std::invalid_argument("Unknown region '" + region_id + "'");
    }
    if (!r->relocatable && base != r->preferred_base) {
        throw std::invalid_argument("Region '" + region_id + "' is not relocatable and must be mapped at " +
                                    hex(r->preferred_base));
    }
    if (is_mapped(region_id)) {
        throw std::invalid_argument("Region '" + region_id + "' is already mapped");
    }

    MappingStack& stack = mapping_stack(base, r->size);
    MappingEntry entry;
    entry.region = r;
    entry.active = active;
    entry.priority = r->priority;
    stack.push(entry);
    mapped_[region_id] = &stack;
    refresh(stack);
}

std::optional<Addr> RegionManager::mapped_base(const std::string& region_id) const {
    auto it = mapped_.find(region_id);
    if (it == mapped_.end()) {
        return std::nullopt;
    }
    return it->second->base();
}

MappingEntry* RegionManager::mapping_of(const std::string& region_id) const {
    auto it = mapped_.find(region_id);
    if (it == mapped_.end()) {
        return nullptr;
    }
    for (const auto& entry : it->second->entries()) {
        if (entry.region->id == region_id) {
            return const_cast<MappingEntry*>(&entry);
        }
    }
    return nullptr;
}

bool RegionManager::activate(const std::string& region_id) {
    auto it = mapped_.find(region_id);
    if (it == mapped_.end() || !it->second->set_active(region_id, true)) {
        return false;
    }
    refresh(*it->second);
    return true;
}

bool RegionManager::deactivate(const std::string& region_id) {
    auto it = mapped_.find(region_id);
    if (it == mapped_.end() || !it->second->set_active(region_id, false)) {
        return false;
    }
    refresh(*it->second);
    return true;
}

bool RegionManager::switch_bank(const std::string& from_id, const std::string& to_id) {
    const MappingEntry* from = mapping_of(from_id);
    const MappingEntry* to = mapping_of(to_id);
    if (!from || !to) {
        return false;
    }
    const bool from_was_active = from->active;
    if (!deactivate(from_id)) {
        return false;
    }
    if (!activate(to_id)) {
        if (from_was_active) {
            activate(from_id);
        }
        return false;
    }
    return true;
}

bool RegionManager::set_region_perms(const std::string& region_id, PagePerms perms) {
    auto it = mapped_.find(region_id);
    if (it == mapped_.end()) {
        return false;
    }
    MappingEntry* entry = mapping_of(region_id);
    MappingEntry updated = *entry;
    updated.perms = perms;
    it->second->replace(region_id, updated);
    refresh(*it->second);
    return true;
}

// ---------------------------------------------------------------------------
// Bring-up layout
// ---------------------------------------------------------------------------

std::vector<RegionPlacement> RegionManager::place_regions() {
    const uint64_t space = address_space_size(address_space_bits_);

    std::vector<PlacedRange> placed;
    for (const auto& [id, stack] : mapped_) {
        placed.push_back(PlacedRange{stack->base(), uint64_t{stack->base()} + stack->size(), id});
    }

    std::vector<RegionPlacement> placements;
    for (const MemoryRegion* r : regions()) {
        if (is_mapped(r->id)) {
            continue;
        }
        if (r->size == 0 || !is_page_aligned(r->size) || !is_page_aligned(r->preferred_base)) {
            throw LayoutError("Region '" + r->id + "' at " + hex(r->preferred_base) + " (" +
                              std::to_string(r->size) + " bytes) is not page aligned");
        }
        if (uint64_t{r->preferred_base} + r->size > space) {
            throw LayoutError("Region '" + r->id + "' at " + hex(r->preferred_base) +
                              " extends past the end of the address space");
        }

        uint64_t base = r->preferred_base;
        bool relocated = false;
        if (const PlacedRange* conflict = first_overlap(placed, base, base + r->size)) {
            if (r->supports_overlay) {
                // Shadowed on the overlapping pages by the region already there
            } else if (r->relocatable) {
                std::optional<uint64_t> found;
                for (int64_t candidate = static_cast<int64_t>(base) - kPageSize;
                     candidate >= 0 && !found; candidate -= kPageSize) {
                    const uint64_t b = static_cast<uint64_t>(candidate);
                    if (!first_overlap(placed, b, b + r->size)) found = b;
                }
                for (uint64_t b = base + kPageSize; !found && b + r->size <= space; b += kPageSize) {
                    if (!first_overlap(placed, b, b + r->size)) found = b;
                }
                if (!found) {
                    throw LayoutError("Region '" + r->id + "' overlaps '" + conflict->region_id +
                                      "' and there is no free range to relocate it to");
                }
                base = *found;
                relocated = true;
            } else {
                throw LayoutError("Region '" + r->id + "' at " + hex(r->preferred_base) +
                                  " overlaps '" + conflict->region_id + "' at " +
                                  hex(conflict->begin));
            }
        }

        map_region_at(r->id, static_cast<Addr>(base), true);
        placed.push_back(PlacedRange{base, base + r->size, r->id});
        placements.push_back(RegionPlacement{r->id, static_cast<Addr>(base), relocated});
    }
    return placements;
}

// ---------------------------------------------------------------------------
// Page table
// ---------------------------------------------------------------------------

PageEntry RegionManager::resolve_page(uint32_t page) const {
    const MappingStack* winner = nullptr;
    int winner_priority = 0;
    for (const auto& stack : stacks_) {
        if (!stack->covers_page(page)) {
            continue;
        }
        const MappingEntry* active = stack->active_entry();
        if (active && (!winner || active->priority < winner_priority)) {
            winner = stack.get();
            winner_priority = active->priority;
        }
    }
    return winner ? winner->to_page_entry(page - winner->first_page()) : PageEntry{};
}

void RegionManager::refresh_pages(MemoryBus& bus, uint32_t first, uint32_t count) const {
    const uint32_t end = std::min(first + count, bus.page_count());
    for (uint32_t page = first; page < end; ++page) {
        bus.map_page(page, resolve_page(page));
    }
}

void RegionManager::refresh(const MappingStack& stack) {
    if (bus_) {
        refresh_pages(*bus_, stack.first_page(), stack.page_count());
    }
}

void RegionManager::attach(MemoryBus& bus) {
    bus_ = &bus;
    build_page_table(bus);
}

void RegionManager::build_page_table(MemoryBus& bus) const {
    bus.unmap_all();
    for (const auto& stack : stacks_) {
        refresh_pages(bus, stack->first_page(), stack->page_count());
    }
}

// ---------------------------------------------------------------------------
// Snapshots and introspection
// ---------------------------------------------------------------------------

RegionSnapshot RegionManager::snapshot() const {
    RegionSnapshot result;
    for (std::size_t i = 0; i < stacks_.size(); ++i) {
        for (const auto& entry : stacks_[i]->entries()) {
            result.entries.push_back({i, entry.region->id, entry.active, entry.perms});
        }
    }
    return result;
}

void RegionManager::restore(const RegionSnapshot& snapshot) {
    std::size_t expected = 0;
    for (const auto& stack : stacks_) {
        expected += stack->count();
    }
    if (snapshot.entries.size() != expected) {
        throw std::invalid_argument("Region snapshot does not match the current mappings");
    }
    for (const auto& saved : snapshot.entries) {
        if (saved.stack >= stacks_.size() || !stacks_[saved.stack]->contains_region(saved.region_id)) {
            throw std::invalid_argument("Region snapshot refers to unknown mapping '" +
                                        saved.region_id + "'");
        }
    }

    for (const auto& saved : snapshot.entries) {
        MappingStack& stack = *stacks_[saved.stack];
        for (const auto& entry : stack.entries()) {
            if (entry.region->id == saved.region_id) {
                MappingEntry updated = entry;
                updated.active = saved.active;
                updated.perms = saved.perms;
                stack.replace(saved.region_id, updated);
                break;
            }
        }
    }
    if (bus_) {
        build_page_table(*bus_);
    }
}

std::vector<MemoryRegionDescriptor> RegionManager::describe() const {
    std::vector<MemoryRegionDescriptor> result;
    for (const MemoryRegion* r : regions()) {
        const MappingEntry* entry = mapping_of(r->id);
        const PagePerms perms = entry ? entry->effective_perms() : r->default_perms;

        RegionFlags flags = RegionFlags::None;
        if (has_flag(perms, PagePerms::Read)) flags |= RegionFlags::Readable;
        if (has_flag(perms, PagePerms::Write)) flags |= RegionFlags::Writable;
        if (has_flag(r->caps(), TargetCaps::HasSideEffects)) flags |= RegionFlags::HasSideEffects;
        if (r->target) flags |= RegionFlags::Populated;
        if (entry) {
            const MappingEntry* visible = mapped_.at(r->id)->active_entry();
            if (visible && visible->region == r) flags |= RegionFlags::Active;
        }

        result.push_back(MemoryRegionDescriptor{
            r->id,
            r->name,
            mapped_base(r->id).value_or(r->preferred_base),
            r->size,
            r->tag,
            r->priority,
            flags,
        });
    }
    return result;
}

} // namespace backplane
