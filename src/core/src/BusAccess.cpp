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

#include "backplane/BusAccess.hpp"
#include "backplane/BusResult.hpp"
#include "backplane/PageEntry.hpp"

namespace backplane {

std::string_view to_string(AccessIntent intent) {
    switch (intent) {
        case AccessIntent::DataRead:         return "DataRead";
        case AccessIntent::DataWrite:        return "DataWrite";
        case AccessIntent::InstructionFetch: return "InstructionFetch";
        case AccessIntent::DebugRead:        return "DebugRead";
        case AccessIntent::DebugWrite:       return "DebugWrite";
        case AccessIntent::DmaRead:          return "DmaRead";
        case AccessIntent::DmaWrite:         return "DmaWrite";
    }
    return "?";
}

std::string_view to_string(RegionTag tag) {
    switch (tag) {
        case RegionTag::Unknown:  return "Unknown";
        case RegionTag::Ram:      return "Ram";
        case RegionTag::Rom:      return "Rom";
        case RegionTag::Io:       return "Io";
        case RegionTag::Slot:     return "Slot";
        case RegionTag::Shadow:   return "Shadow";
        case RegionTag::Unmapped: return "Unmapped";
        case RegionTag::Video:    return "Video";
        case RegionTag::ZeroPage: return "ZeroPage";
        case RegionTag::Stack:    return "Stack";
    }
    return "?";
}

std::string_view to_string(FaultKind kind) {
    switch (kind) {
        case FaultKind::None:       return "None";
        case FaultKind::Unmapped:   return "Unmapped";
        case FaultKind::Permission: return "Permission";
        case FaultKind::NoExecute:  return "NoExecute";
    }
    return "?";
}

} // namespace backplane
