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

#ifndef BACKPLANE_PHYSICAL_MEMORY_HPP
#define BACKPLANE_PHYSICAL_MEMORY_HPP

#include "DebugPrivilege.hpp"
#include "Types.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace backplane {

// Raw byte storage for one RAM or ROM pool.
//
// Owns its bytes; everything else (bus targets, the debugger) works with
// spans obtained from slice(). No access semantics live here.
class PhysicalMemory {
public:
    PhysicalMemory(uint32_t size, std::string name);

    // Non-copyable: targets hold spans into storage_
    PhysicalMemory(const PhysicalMemory&) = delete;
    PhysicalMemory& operator=(const PhysicalMemory&) = delete;

    uint32_t size() const { return static_cast<uint32_t>(storage_.size()); }
    const std::string& name() const { return name_; }

    // Views. Throw std::out_of_range if [offset, offset + length) exceeds size().
    std::span<uint8_t> slice(uint32_t offset, uint32_t length);
    std::span<const uint8_t> read_only_slice(uint32_t offset, uint32_t length) const;

    std::span<uint8_t> slice_page(uint32_t page, uint32_t page_size = kPageSize);

    // Number of whole or partial pages covering the pool
    uint32_t page_count(uint32_t page_size = kPageSize) const;

    std::span<const uint8_t> data() const { return storage_; }

    void fill(uint8_t value);
    void clear() { fill(0); }

    // Privileged bulk write, bypassing any device behaviour.
    void write_physical(const DebugPrivilege& privilege, uint32_t offset,
                        std::span<const uint8_t> bytes);

    // Holder of the privilege used by the most recent write_physical(), if any
    const std::string& last_privileged_writer() const { return last_writer_; }

private:
    void check_range(uint32_t offset, uint32_t length) const;

    std::string name_;
    std::vector<uint8_t> storage_;
    std::string last_writer_;
};

} // namespace backplane

#endif // BACKPLANE_PHYSICAL_MEMORY_HPP
