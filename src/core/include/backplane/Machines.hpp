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

#ifndef BACKPLANE_MACHINES_HPP
#define BACKPLANE_MACHINES_HPP

#include "BringUp.hpp"
#include "CpuPolicy.hpp"
#include "Machine.hpp"
#include "MachineConstants.hpp"
#include "ProvisioningBundle.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace backplane {

// Convenience type aliases for the supported CPUs.
// The board itself comes from BringUp, so any CPU can drive any model.

// Apple II, II+ and most 6502 boards
using Nmos6502Machine = Machine<Nmos6502>;

// Enhanced Apple IIe and later
using Cmos65C02Machine = Machine<Cmos65C02>;

using Rockwell65C02Machine = Machine<Rockwell65C02>;

// Brings up a board and puts a CPU on it. Bring-up warnings are appended
// to `warnings` if given. Throws std::runtime_error if bring-up fails.
template<typename CpuPolicy>
std::unique_ptr<Machine<CpuPolicy>> make_machine(const MachineConstants& constants,
                                                 const ProvisioningBundle& bundle,
                                                 std::vector<std::string>* warnings = nullptr) {
    BringUpResult result = BringUp(constants).bring_up(bundle);
    if (warnings) {
        warnings->insert(warnings->end(), result.warnings.begin(), result.warnings.end());
    }
    if (!result.success) {
        throw std::runtime_error(result.error_message);
    }
    return std::make_unique<Machine<CpuPolicy>>(std::move(result.motherboard));
}

} // namespace backplane

#endif // BACKPLANE_MACHINES_HPP
