#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>

namespace evsim::core {

class Components;
class State;

namespace detail {
template<typename C>
class ComponentModel;
} // namespace detail

/// @brief Raw numeric value carried by every typed handle.
/// @ingroup core_handles
using IdValue = std::uint64_t;

/// @brief Sentinel carried by default-constructed (invalid) handles.
/// @ingroup core_handles
inline constexpr IdValue INVALID_ID = std::numeric_limits<IdValue>::max();

/// @brief Return a fresh identifier from the process-wide monotonic counter.
///
/// Used for component ids and value keys so that ids embedded in event
/// entries stay unique across every Simulation created in the process.
/// Thread-safe; the only contract is that two calls never return the
/// same value.
/// @ingroup core_handles
[[nodiscard]] IdValue next_global_id() noexcept;

/// @brief Type-safe identifier of a registered component.
/// @ingroup core_handles
///
/// The template parameter is the component's event type. It is a pure
/// marker: nothing of type @p E is stored, but Scheduler::schedule() only
/// accepts an event convertible to @p E for a `ComponentId<E>`, so sending
/// the wrong event type to a component does not compile.
///
/// Only Components can mint valid identifiers. Default-constructed
/// instances are invalid.
///
/// @tparam E Event type handled by the component.
/// @see Components::add_component, Scheduler::schedule
template<typename E>
class ComponentId {
    friend class Components;
    template<typename C>
    friend class detail::ComponentModel;

public:
    using event_type = E;

    /// @brief Default-construct an invalid identifier.
    constexpr ComponentId() noexcept = default;

    /// @brief Raw numeric id, as stored in event entries.
    [[nodiscard]] constexpr IdValue value() const noexcept { return id_; }

    /// @brief Check whether this identifier was minted by a registry.
    [[nodiscard]] constexpr bool valid() const noexcept { return id_ != INVALID_ID; }

    constexpr auto operator<=>(const ComponentId&) const noexcept = default;
    constexpr bool operator==(const ComponentId&) const noexcept = default;

private:
    explicit constexpr ComponentId(IdValue id) noexcept : id_(id) {}

    IdValue id_{INVALID_ID};
};

/// @brief Type-safe key into the State value store.
/// @ingroup core_handles
///
/// A key can be obtained only from State::insert(). A key minted for a
/// value of type @p V cannot be used to read a value of another type:
/// `State::get(Key<int>)` returns `const int*`, and passing a `Key<int>`
/// where a `Key<std::string>` is expected does not compile.
///
/// @tparam V Type of the stored value.
/// @see State::insert, State::get, State::remove
template<typename V>
class Key {
    friend class State;

public:
    using value_type = V;

    /// @brief Default-construct an invalid key.
    constexpr Key() noexcept = default;

    /// @brief Raw numeric id.
    [[nodiscard]] constexpr IdValue value() const noexcept { return id_; }

    /// @brief Check whether this key was minted by a State.
    [[nodiscard]] constexpr bool valid() const noexcept { return id_ != INVALID_ID; }

    constexpr auto operator<=>(const Key&) const noexcept = default;
    constexpr bool operator==(const Key&) const noexcept = default;

private:
    explicit constexpr Key(IdValue id) noexcept : id_(id) {}

    IdValue id_{INVALID_ID};
};

/// @brief Type-safe identifier of a queue registered in a State.
/// @ingroup core_handles
///
/// The template parameter is the concrete queue type (e.g. `Fifo<int>`),
/// which lets State::send() and State::recv() infer the item type and
/// lets State::queue() hand back the concrete queue.
///
/// Queue ids are allocated from a counter local to the owning State, so
/// a QueueId is only meaningful for the State that returned it.
///
/// @tparam Q Concrete queue type.
/// @see State::add_queue
template<typename Q>
class QueueId {
    friend class State;

public:
    using queue_type = Q;

    /// @brief Default-construct an invalid queue identifier.
    constexpr QueueId() noexcept = default;

    /// @brief Raw numeric id.
    [[nodiscard]] constexpr IdValue value() const noexcept { return id_; }

    /// @brief Check whether this identifier was minted by a State.
    [[nodiscard]] constexpr bool valid() const noexcept { return id_ != INVALID_ID; }

    constexpr auto operator<=>(const QueueId&) const noexcept = default;
    constexpr bool operator==(const QueueId&) const noexcept = default;

private:
    explicit constexpr QueueId(IdValue id) noexcept : id_(id) {}

    IdValue id_{INVALID_ID};
};

} // namespace evsim::core

template<typename E>
struct std::hash<evsim::core::ComponentId<E>> {
    std::size_t operator()(const evsim::core::ComponentId<E>& id) const noexcept {
        return std::hash<evsim::core::IdValue>{}(id.value());
    }
};

template<typename V>
struct std::hash<evsim::core::Key<V>> {
    std::size_t operator()(const evsim::core::Key<V>& key) const noexcept {
        return std::hash<evsim::core::IdValue>{}(key.value());
    }
};

template<typename Q>
struct std::hash<evsim::core::QueueId<Q>> {
    std::size_t operator()(const evsim::core::QueueId<Q>& id) const noexcept {
        return std::hash<evsim::core::IdValue>{}(id.value());
    }
};
