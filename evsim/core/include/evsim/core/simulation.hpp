#pragma once

#include <evsim/core/component.hpp>
#include <evsim/core/ids.hpp>
#include <evsim/core/queue.hpp>
#include <evsim/core/scheduler.hpp>
#include <evsim/core/state.hpp>
#include <evsim/core/trace_writer.hpp>
#include <evsim/core/types.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace evsim::core {

/// @brief Puts the parts of a simulation together.
///
/// A Simulation owns exactly one State, one Scheduler and one Components
/// registry, and nothing else. Each step pops the earliest event from
/// the scheduler and hands it to the component it targets; the handler
/// may in turn read and write the state and schedule further events.
///
/// A typical usage pattern is:
///
/// @code
/// core::Simulation sim;
/// auto queue = sim.add_queue(core::Fifo<Product>{});
/// auto consumer = sim.add_component(Consumer{queue});
/// auto producer = sim.add_component(Producer{queue, consumer});
/// sim.schedule(core::Duration::zero(), producer, ProducerEvent{});
/// sim.run();
/// @endcode
///
/// For other termination policies, see Executor.
///
/// @see Executor, TraceWriter
/// @ingroup core_engine
class Simulation {
public:
    /// @brief Callback invoked after each successful step.
    using SideEffect = std::function<void(const Simulation&)>;

    Simulation() = default;

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;
    /// A moved-from Simulation has no pending events and its clock is
    /// back at the epoch.
    Simulation(Simulation&&) = default;
    Simulation& operator=(Simulation&&) = default;

    [[nodiscard]] State& state() noexcept { return state_; }
    [[nodiscard]] const State& state() const noexcept { return state_; }

    [[nodiscard]] Scheduler& scheduler() noexcept { return scheduler_; }
    [[nodiscard]] const Scheduler& scheduler() const noexcept { return scheduler_; }

    [[nodiscard]] Components& components() noexcept { return components_; }
    [[nodiscard]] const Components& components() const noexcept { return components_; }

    /// @brief Returns the current simulation time.
    [[nodiscard]] TimePoint time() const noexcept { return scheduler_.time(); }

    /// @brief Register a component. See Components::add_component.
    template<typename C>
    [[nodiscard]] ComponentId<typename C::Event> add_component(C component) {
        return add_component(std::make_shared<C>(std::move(component)));
    }

    /// @brief Register a shared component. See Components::add_component.
    template<typename C>
    [[nodiscard]] ComponentId<typename C::Event> add_component(std::shared_ptr<C> component) {
        auto id = components_.add_component(std::move(component));
        trace([&](TraceWriter& w) {
            w.type("component_added");
            w.field("component_id", id.value());
        });
        return id;
    }

    /// @brief Register a queue in the state. See State::add_queue.
    template<typename Q>
    [[nodiscard]] QueueId<Q> add_queue(Q queue) {
        auto id = state_.add_queue(std::move(queue));
        trace([&](TraceWriter& w) {
            w.type("queue_added");
            w.field("queue_id", id.value());
        });
        return id;
    }

    /// @brief Register a FIFO queue holding at most @p capacity items.
    ///
    /// With a capacity of zero every send reports PushResult::CapacityExceeded.
    template<typename T>
    [[nodiscard]] QueueId<Fifo<T>> add_bounded_queue(std::size_t capacity) {
        return add_queue(Fifo<T>::bounded(capacity));
    }

    /// @brief Schedule @p event for @p component at `time() + delay`.
    template<typename E>
    void schedule(Duration delay, ComponentId<E> component, std::type_identity_t<E> event) {
        scheduler_.schedule<E>(delay, component, std::move(event));
    }

    /// @brief Schedule @p event for @p component at the current time.
    template<typename E>
    void schedule_now(ComponentId<E> component, std::type_identity_t<E> event) {
        scheduler_.schedule_now<E>(component, std::move(event));
    }

    /// @brief Process the earliest scheduled event.
    /// @return false if there was no event left, signalling the end of the simulation.
    bool step();

    /// @brief Step until no event is left.
    ///
    /// Does not return if components keep scheduling events forever.
    void run();

    /// @brief Step until no event is left, calling @p side_effect after each step.
    void run(const SideEffect& side_effect);

    /// @brief Set the trace writer for simulation event logging.
    ///
    /// The Simulation does not own the writer. Pass nullptr to disable tracing.
    void set_trace_writer(TraceWriter* writer) noexcept { trace_writer_ = writer; }

    /// @brief Invoke a tracing callback only if a trace writer is set.
    ///
    /// The record is stamped with the current simulation time.
    ///
    /// @tparam F Callable with signature void(TraceWriter&).
    template<typename F>
    void trace(F&& func);

private:
    State state_;
    Scheduler scheduler_;
    Components components_;
    TraceWriter* trace_writer_{nullptr};
};

// Template implementation
template<typename F>
void Simulation::trace(F&& func) {
    if (trace_writer_) {
        trace_writer_->begin(scheduler_.time());
        func(*trace_writer_);
        trace_writer_->end();
    }
}

} // namespace evsim::core
