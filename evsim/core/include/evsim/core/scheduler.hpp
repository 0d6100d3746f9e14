#pragma once

#include <evsim/core/clock.hpp>
#include <evsim/core/event_entry.hpp>
#include <evsim/core/ids.hpp>
#include <evsim/core/types.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace evsim::core {

/// @brief Keeps the simulation clock and the ordered set of pending events.
///
/// Events are keyed by (time, sequence), so the earliest event is popped
/// first and events sharing a timestamp come out in the order they were
/// scheduled. The Scheduler owns the clock cell: pop() is the only
/// operation that advances time, and since every event is scheduled at
/// `time() + delay` with a non-negative delay, time never goes backwards.
///
/// @code
/// core::Scheduler scheduler;
/// scheduler.schedule(duration_from_seconds(1.0), component_id, MyEvent{});
/// while (auto entry = scheduler.pop()) {
///     components.process_event_entry(std::move(*entry), scheduler, state);
/// }
/// @endcode
///
/// @see EventEntry, ClockRef, Components
/// @ingroup core_engine
class Scheduler {
public:
    Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /// @brief Take over the events and the clock cell of @p other.
    ///
    /// ClockRefs taken from @p other keep observing the moved clock.
    /// @p other is left empty at the epoch with a clock cell of its own.
    Scheduler(Scheduler&& other);
    Scheduler& operator=(Scheduler&& other);

    /// @brief Schedule @p event for @p component at `time() + delay`.
    ///
    /// Only events convertible to the component's event type are accepted;
    /// anything else is rejected at compile time.
    template<typename E>
    void schedule(Duration delay, ComponentId<E> component, std::type_identity_t<E> event) {
        EventKey key{time() + delay, sequence_++};
        events_.emplace(key, EventEntry(key, component, std::move(event)));
    }

    /// @brief Schedule @p event for @p component at the current time.
    ///
    /// The event fires after every event already scheduled for the
    /// current time.
    template<typename E>
    void schedule_now(ComponentId<E> component, std::type_identity_t<E> event) {
        schedule<E>(Duration::zero(), component, std::move(event));
    }

    /// @brief Remove and return the earliest event, advancing the clock to its time.
    /// @return The entry, or std::nullopt if nothing is scheduled.
    [[nodiscard]] std::optional<EventEntry> pop();

    /// @brief Observe the earliest event without removing it.
    /// @return Pointer to the entry, or nullptr if nothing is scheduled.
    [[nodiscard]] const EventEntry* peek() const noexcept;

    /// @brief Returns the current simulation time.
    [[nodiscard]] TimePoint time() const noexcept { return *clock_; }

    /// @brief Returns a read-only handle observing the simulation clock.
    [[nodiscard]] ClockRef clock() const { return ClockRef{clock_}; }

    [[nodiscard]] bool empty() const noexcept { return events_.empty(); }

    /// @brief Number of pending events.
    [[nodiscard]] std::size_t size() const noexcept { return events_.size(); }

private:
    std::shared_ptr<TimePoint> clock_;
    uint64_t sequence_{0};
    std::map<EventKey, EventEntry> events_;
};

} // namespace evsim::core
