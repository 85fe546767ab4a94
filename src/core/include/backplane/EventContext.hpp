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

#pragma once

#include "Types.hpp"

namespace backplane {

class MemoryBus;
class Scheduler;
class SignalBus;

// What scheduled callbacks and device initialisation get to work with.
// All three collaborators are owned by the Motherboard and outlive the context.
class EventContext {
public:
    EventContext(Scheduler& scheduler, SignalBus& signals, MemoryBus& bus)
        : scheduler_(scheduler), signals_(signals), bus_(bus) {}

    Scheduler& scheduler() const { return scheduler_; }
    SignalBus& signals() const { return signals_; }
    MemoryBus& bus() const { return bus_; }

    Cycle now() const;

private:
    Scheduler& scheduler_;
    SignalBus& signals_;
    MemoryBus& bus_;
};

} // namespace backplane
