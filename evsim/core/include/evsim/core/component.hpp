#pragma once

#include <evsim/core/error.hpp>
#include <evsim/core/event_entry.hpp>
#include <evsim/core/ids.hpp>
#include <evsim/core/scheduler.hpp>
#include <evsim/core/state.hpp>

#include <cstddef>
#include <memory>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace evsim::core {

/// @brief Interface of a simulation component.
/// @ingroup core_components
///
/// A component reacts to events of a single type @p E. The handler
/// receives:
/// - `self_id`: the component's own identifier, used to schedule events
///   to itself (it only exists once the component has been registered);
/// - `event`: the event being delivered;
/// - `scheduler`: to read the time and schedule further events;
/// - `state`: to access values and queues.
///
/// The handler is const. Data that changes during the simulation lives
/// in the State, or in members the component declares `mutable`.
///
/// @code
/// struct Ping {};
///
/// class Pinger final : public core::Component<Ping> {
/// public:
///     void process_event(core::ComponentId<Ping> self, const Ping&,
///                        core::Scheduler& scheduler, core::State&) const override {
///         scheduler.schedule(core::duration_from_seconds(1.0), self, Ping{});
///     }
/// };
/// @endcode
///
/// @tparam E Event type the component reacts to.
/// @see Components::add_component
template<typename E>
class Component {
public:
    using Event = E;

    virtual ~Component() = default;

    /// @brief React to @p event.
    virtual void process_event(ComponentId<E> self_id, const E& event,
                               Scheduler& scheduler, State& state) const = 0;

protected:
    Component() = default;
    Component(const Component&) = default;
    Component& operator=(const Component&) = default;
    Component(Component&&) = default;
    Component& operator=(Component&&) = default;
};

namespace detail {

/// @brief Type-erased dispatcher stored in the registry.
class ComponentConcept {
public:
    virtual ~ComponentConcept() = default;

    virtual void process_event_entry(const EventEntry& entry, Scheduler& scheduler,
                                     State& state) const = 0;
};

/// @brief Dispatcher capturing the concrete component type @p C.
///
/// Recovers the event type from `C::Event`, downcasts the payload and
/// forwards to the component's handler.
template<typename C>
class ComponentModel final : public ComponentConcept {
public:
    using Event = typename C::Event;

    explicit ComponentModel(std::shared_ptr<const C> component)
        : component_(std::move(component)) {}

    void process_event_entry(const EventEntry& entry, Scheduler& scheduler,
                             State& state) const override {
        const Event* event = entry.downcast<Event>();
        if (event == nullptr) {
            invariant_failure("event payload does not match the component's event type");
        }
        component_->process_event(ComponentId<Event>(entry.component_idx()), *event,
                                  scheduler, state);
    }

private:
    std::shared_ptr<const C> component_;
};

} // namespace detail

/// @brief Container holding every registered component.
/// @ingroup core_components
///
/// Components of unrelated types live side by side; each is wrapped at
/// registration in a dispatcher that knows its concrete type. The
/// registry is append-only: components cannot be removed.
///
/// Component ids are drawn from the process-wide id counter.
///
/// @see Component, Scheduler, Simulation
class Components {
public:
    Components() = default;

    Components(const Components&) = delete;
    Components& operator=(const Components&) = delete;
    Components(Components&&) = default;
    Components& operator=(Components&&) = default;

    /// @brief Register @p component and return its identifier.
    template<typename C>
    [[nodiscard]] ComponentId<typename C::Event> add_component(C component) {
        return add_component(std::make_shared<C>(std::move(component)));
    }

    /// @brief Register a shared component.
    ///
    /// The caller keeps its own reference and can inspect the component
    /// while the simulation runs.
    template<typename C>
    [[nodiscard]] ComponentId<typename C::Event> add_component(std::shared_ptr<C> component) {
        using Event = typename C::Event;
        static_assert(std::is_base_of_v<Component<Event>, C>,
                      "components must derive from evsim::core::Component<Event>");
        if (!component) {
            throw InvalidArgumentError("Cannot register a null component");
        }

        const IdValue id = next_global_id();
        components_.emplace(id, std::make_unique<detail::ComponentModel<std::remove_const_t<C>>>(
                                    std::shared_ptr<const C>(std::move(component))));
        return ComponentId<Event>(id);
    }

    /// @brief Deliver @p entry to the component it targets.
    ///
    /// An entry targeting an unknown component is a programming error and
    /// aborts the process.
    void process_event_entry(EventEntry entry, Scheduler& scheduler, State& state) const;

    [[nodiscard]] bool contains(IdValue component_idx) const noexcept {
        return components_.contains(component_idx);
    }

    /// @brief Number of registered components.
    [[nodiscard]] std::size_t size() const noexcept { return components_.size(); }

private:
    std::unordered_map<IdValue, std::unique_ptr<detail::ComponentConcept>> components_;
};

} // namespace evsim::core
