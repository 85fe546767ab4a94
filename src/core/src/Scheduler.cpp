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

#include "backplane/Scheduler.hpp"
#include "backplane/EventContext.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace backplane {

std::string_view to_string(ScheduledEventKind kind) {
    switch (kind) {
        case ScheduledEventKind::None:                return "None";
        case ScheduledEventKind::DeviceTimer:         return "DeviceTimer";
        case ScheduledEventKind::InterruptLineChange: return "InterruptLineChange";
        case ScheduledEventKind::DmaPhase:            return "DmaPhase";
        case ScheduledEventKind::AudioTick:           return "AudioTick";
        case ScheduledEventKind::VideoScanline:       return "VideoScanline";
        case ScheduledEventKind::VideoBlank:          return "VideoBlank";
        case ScheduledEventKind::DeferredWork:        return "DeferredWork";
        case ScheduledEventKind::Custom:              return "Custom";
    }
    return "?";
}

Cycle EventContext::now() const {
    return scheduler_.now();
}

EventHandle Scheduler::schedule_at(Cycle due, ScheduledEventKind kind, int priority,
                                   EventCallback callback, uint64_t tag) {
    if (!callback) {
        throw std::invalid_argument("Scheduled event requires a callback");
    }
    const uint64_t id = next_id_++;
    heap_.push_back(Event{due, priority, id, kind, tag, std::move(callback)});
    std::push_heap(heap_.begin(), heap_.end(), Later{});
    pending_.insert(id);
    return EventHandle(id);
}

EventHandle Scheduler::schedule_after(Cycle delta, ScheduledEventKind kind, int priority,
                                      EventCallback callback, uint64_t tag) {
    return schedule_at(now_ + delta, kind, priority, std::move(callback), tag);
}

bool Scheduler::cancel(EventHandle handle) {
    if (!handle.is_valid() || handle.id_ >= next_id_) {
        throw std::invalid_argument(
            "Event handle " + std::to_string(handle.id_) + " was not issued by this scheduler");
    }
    if (pending_.erase(handle.id_) == 0) {
        return false;
    }
    discard_cancelled_top();
    return true;
}

void Scheduler::advance(Cycle delta) {
    const Cycle target = now_ + delta;
    dispatch_until(target);
    now_ = target;
}

void Scheduler::dispatch_due() {
    dispatch_until(now_);
}

std::optional<Cycle> Scheduler::peek_next_due() const {
    // Cancelled events never stay on top of the heap
    if (heap_.empty()) {
        return std::nullopt;
    }
    return heap_.front().due;
}

bool Scheduler::jump_to_next_event_and_dispatch() {
    const auto next = peek_next_due();
    if (!next) {
        return false;
    }
    if (*next > now_) {
        now_ = *next;
    }
    dispatch_until(now_);
    return true;
}

void Scheduler::reset() {
    heap_.clear();
    pending_.clear();
    now_ = 0;
}

void Scheduler::dispatch_until(Cycle target) {
    while (!heap_.empty() && heap_.front().due <= target) {
        if (!context_) {
            throw std::logic_error("Scheduler has no event context; call set_event_context() first");
        }
        std::pop_heap(heap_.begin(), heap_.end(), Later{});
        Event event = std::move(heap_.back());
        heap_.pop_back();
        pending_.erase(event.id);
        discard_cancelled_top();

        if (event.due > now_) {
            now_ = event.due;
        }
        event.callback(*context_);
    }
}

void Scheduler::discard_cancelled_top() {
    while (!heap_.empty() && !pending_.contains(heap_.front().id)) {
        std::pop_heap(heap_.begin(), heap_.end(), Later{});
        heap_.pop_back();
    }
}

} // namespace backplane
