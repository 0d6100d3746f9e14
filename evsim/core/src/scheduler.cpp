#include <evsim/core/scheduler.hpp>

namespace evsim::core {

Scheduler::Scheduler()
    : clock_(std::make_shared<TimePoint>(TimePoint::epoch())) {}

Scheduler::Scheduler(Scheduler&& other)
    : clock_(std::exchange(other.clock_, std::make_shared<TimePoint>(TimePoint::epoch())))
    , sequence_(std::exchange(other.sequence_, 0))
    , events_(std::move(other.events_)) {
    other.events_.clear();
}

Scheduler& Scheduler::operator=(Scheduler&& other) {
    if (this != &other) {
        auto fresh = std::make_shared<TimePoint>(TimePoint::epoch());
        clock_ = std::exchange(other.clock_, std::move(fresh));
        sequence_ = std::exchange(other.sequence_, 0);
        events_ = std::move(other.events_);
        other.events_.clear();
    }
    return *this;
}

std::optional<EventEntry> Scheduler::pop() {
    if (events_.empty()) {
        return std::nullopt;
    }

    auto node = events_.extract(events_.begin());
    *clock_ = node.key().time;
    return std::optional<EventEntry>(std::move(node.mapped()));
}

const EventEntry* Scheduler::peek() const noexcept {
    if (events_.empty()) {
        return nullptr;
    }
    return &events_.begin()->second;
}

} // namespace evsim::core
