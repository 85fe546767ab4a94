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

#ifndef BACKPLANE_SCHEDULER_HPP
#define BACKPLANE_SCHEDULER_HPP

#include "Types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace backplane {

class EventContext;

enum class ScheduledEventKind : uint8_t {
    None,
    DeviceTimer,
    InterruptLineChange,
    DmaPhase,
    AudioTick,
    VideoScanline,
    VideoBlank,
    DeferredWork,
    Custom,
};

std::string_view to_string(ScheduledEventKind kind);

// Opaque reference to a scheduled event. A default constructed handle
// refers to nothing and is rejected by Scheduler::cancel().
class EventHandle {
public:
    EventHandle() = default;

    uint64_t id() const { return id_; }
    bool is_valid() const { return id_ != 0; }

    bool operator==(const EventHandle&) const = default;

private:
    friend class Scheduler;
    explicit EventHandle(uint64_t id) : id_(id) {}

    uint64_t id_ = 0;
};

using EventCallback = std::function<void(EventContext&)>;

// Discrete-event scheduler and the single source of machine time.
//
// Events are ordered by (due, priority, sequence): lower priority values
// fire first among events due on the same cycle, and events with equal due
// and priority fire in the order they were scheduled. While a callback runs,
// now() equals the event's due cycle (or the current time, for events that
// were scheduled in the past). Time never moves backwards.
//
// Events scheduled from inside a callback are dispatched within the same
// advance() if they are already due.
class Scheduler {
public:
    Scheduler() = default;

    // Non-copyable: events capture references to devices
    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    Cycle now() const { return now_; }

    // Must be set before anything is dispatched
    void set_event_context(EventContext& context) { context_ = &context; }
    EventContext* event_context() const { return context_; }

    // A due cycle at or before now() is legal; the event fires on the next dispatch.
    EventHandle schedule_at(Cycle due, ScheduledEventKind kind, int priority,
                            EventCallback callback, uint64_t tag = 0);

    EventHandle schedule_after(Cycle delta, ScheduledEventKind kind, int priority,
                               EventCallback callback, uint64_t tag = 0);

    // Returns true if the event was pending and is now cancelled, false if it
    // had already fired or been cancelled. Throws std::invalid_argument for a
    // handle this scheduler never issued.
    bool cancel(EventHandle handle);

    // Move time forward by delta cycles, dispatching everything due on the way.
    // advance(0) dispatches events that are already due.
    void advance(Cycle delta);

    // Dispatch events due at or before now()
    void dispatch_due();

    std::optional<Cycle> peek_next_due() const;

    // Fast-forward over idle time: move now() to the next event's due cycle
    // (if it is in the future) and dispatch everything due then.
    // Returns false if nothing is pending.
    bool jump_to_next_event_and_dispatch();

    // Drop all events and return time to zero. Handles issued before the
    // reset stay distinct from any issued after it.
    void reset();

    std::size_t pending_count() const { return pending_.size(); }

    bool is_pending(EventHandle handle) const { return pending_.contains(handle.id_); }

private:
    struct Event {
        Cycle due;
        int priority;
        uint64_t id;  // Also the scheduling sequence number
        ScheduledEventKind kind;
        uint64_t tag;
        EventCallback callback;
    };

    // Heap comparator: the top of the heap is the earliest event
    struct Later {
        bool operator()(const Event& lhs, const Event& rhs) const {
            if (lhs.due != rhs.due) return lhs.due > rhs.due;
            if (lhs.priority != rhs.priority) return lhs.priority > rhs.priority;
            return lhs.id > rhs.id;
        }
    };

    void dispatch_until(Cycle target);
    void discard_cancelled_top();

    Cycle now_ = 0;
    uint64_t next_id_ = 1;
    std::vector<Event> heap_;
    std::unordered_set<uint64_t> pending_;
    EventContext* context_ = nullptr;
};

} // namespace backplane

#endif // BACKPLANE_SCHEDULER_HPP
