#pragma once

#include <evsim/core/any_box.hpp>
#include <evsim/core/ids.hpp>
#include <evsim/core/types.hpp>

#include <compare>
#include <cstdint>
#include <type_traits>
#include <utility>

namespace evsim::core {

/// @brief Deterministic ordering key for events in the scheduler.
///
/// Events are ordered first by simulation time, then by insertion
/// sequence number, so events sharing a timestamp are dispatched in the
/// order they were scheduled.
///
/// @see Scheduler::schedule
/// @ingroup core_events
struct EventKey {
    TimePoint time;      ///< Primary: simulation time at which the event fires.
    uint64_t sequence;   ///< Secondary: insertion order for determinism.

    /// @cond INTERNAL
    auto operator<=>(const EventKey&) const = default;
    /// @endcond
};

/// @brief A scheduled unit of work: time, target component, and event payload.
/// @ingroup core_events
///
/// The payload's static type is erased when the entry is created; only
/// the numeric component id is kept next to it. Components recovers both
/// the typed id and the typed event when it dispatches the entry.
///
/// Entries are move-only.
///
/// @see Scheduler::pop, Components::process_event_entry
class EventEntry {
public:
    /// @brief Build an entry for @p component carrying @p event.
    ///
    /// The event parameter is not deduced: it must be convertible to the
    /// component's event type @p E.
    template<typename E>
    EventEntry(EventKey key, ComponentId<E> component, std::type_identity_t<E> event)
        : key_(key)
        , component_(component.value())
        , payload_(std::move(event)) {}

    EventEntry(EventEntry&&) noexcept = default;
    EventEntry& operator=(EventEntry&&) noexcept = default;
    EventEntry(const EventEntry&) = delete;
    EventEntry& operator=(const EventEntry&) = delete;

    [[nodiscard]] const EventKey& key() const noexcept { return key_; }

    /// @brief Time at which the event fires.
    [[nodiscard]] TimePoint time() const noexcept { return key_.time; }

    /// @brief Insertion sequence number assigned by the scheduler.
    [[nodiscard]] uint64_t sequence() const noexcept { return key_.sequence; }

    /// @brief Raw id of the target component.
    [[nodiscard]] IdValue component_idx() const noexcept { return component_; }

    /// @brief View the payload as an @p E, or nullptr if it holds another type.
    template<typename E>
    [[nodiscard]] const E* downcast() const noexcept {
        return payload_.get<E>();
    }

private:
    EventKey key_;
    IdValue component_;
    detail::AnyBox payload_;
};

} // namespace evsim::core
