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

#include "backplane/PhysicalMemory.hpp"

#include <algorithm>
#include <stdexcept>

namespace backplane {

PhysicalMemory::PhysicalMemory(uint32_t size, std::string name)
    : name_(std::move(name))
{
    if (size == 0) {
        throw std::invalid_argument("Physical memory '" + name_ + "' must not be empty");
    }
    storage_.resize(size, 0);
}

void PhysicalMemory::check_range(uint32_t offset, uint32_t length) const {
    const uint64_t end = uint64_t{offset} + length;
    if (end > storage_.size()) {
        throw std::out_of_range(
            "Range [" + std::to_string(offset) + ", " + std::to_string(end) +
            ") exceeds physical memory '" + name_ + "' of " +
            std::to_string(storage_.size()) + " bytes");
    }
}

std::span<uint8_t> PhysicalMemory::slice(uint32_t offset, uint32_t length) {
    check_range(offset, length);
    return std::span<uint8_t>(storage_).subspan(offset, length);
}

std::span<const uint8_t> PhysicalMemory::read_only_slice(uint32_t offset, uint32_t length) const {
    check_range(offset, length);
    return std::span<const uint8_t>(storage_).subspan(offset, length);
}

std::span<uint8_t> PhysicalMemory::slice_page(uint32_t page, uint32_t page_size) {
    const uint64_t offset = uint64_t{page} * page_size;
    if (offset >= storage_.size()) {
        throw std::out_of_range(
            "Page " + std::to_string(page) + " is outside physical memory '" + name_ + "'");
    }
    const uint32_t length = static_cast<uint32_t>(
        std::min<uint64_t>(page_size, storage_.size() - offset));
    return slice(static_cast<uint32_t>(offset), length);
}

uint32_t PhysicalMemory::page_count(uint32_t page_size) const {
    return static_cast<uint32_t>((storage_.size() + page_size - 1) / page_size);
}

void PhysicalMemory::fill(uint8_t value) {
    std::fill(storage_.begin(), storage_.end(), value);
}

void PhysicalMemory::write_physical(const DebugPrivilege& privilege, uint32_t offset,
                                    std::span<const uint8_t> bytes) {
    check_range(offset, static_cast<uint32_t>(bytes.size()));
    std::copy(bytes.begin(), bytes.end(), storage_.begin() + offset);
    last_writer_ = privilege.holder();
}

} // namespace backplane
