#pragma once

#include <evsim/core/simulation.hpp>
#include <evsim/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>

namespace evsim::core {

/// @brief Drives a Simulation until a termination policy fires.
/// @ingroup core_engine
///
/// Four policies are available:
/// - unbound(): step until the scheduler is empty;
/// - timed(T): step while the next event is scheduled at or before T.
///   The clock is left at the time of the last dispatched event, not
///   moved forward to T;
/// - steps(n): execute at most n steps;
/// - until(pred): step until @p pred returns true (checked before each step).
///
/// Every policy also stops as soon as the scheduler runs empty. An
/// optional side effect installed with side_effect() is called after
/// each successful step, never for the final empty pop.
///
/// @code
/// std::vector<core::TimePoint> times;
/// core::Executor::timed(core::time_from_seconds(10.0))
///     .side_effect([&](const core::Simulation& sim) { times.push_back(sim.time()); })
///     .execute(sim);
/// @endcode
///
/// Executors are cheap value objects and can be reused.
class Executor {
public:
    /// @brief Termination policy of an executor.
    enum class EndCondition : std::uint8_t {
        EmptyQueue,  ///< Run until no event is left.
        Time,        ///< Run while the next event is not later than a time limit.
        Steps,       ///< Run at most a fixed number of steps.
        Predicate,   ///< Run until a user predicate holds.
    };

    /// @brief Stop condition evaluated before each step.
    using StopPredicate = std::function<bool(const Simulation&)>;

    [[nodiscard]] static Executor unbound();

    [[nodiscard]] static Executor timed(TimePoint until);

    [[nodiscard]] static Executor steps(std::size_t steps);

    /// @throws InvalidArgumentError if @p predicate is empty.
    [[nodiscard]] static Executor until(StopPredicate predicate);

    /// @brief Return a copy of this executor calling @p func after each step.
    [[nodiscard]] Executor side_effect(Simulation::SideEffect func) const;

    /// @brief Run @p sim under this executor's policy.
    /// @return Number of steps executed.
    std::size_t execute(Simulation& sim) const;

    [[nodiscard]] EndCondition end_condition() const noexcept { return end_condition_; }

    /// @brief Time limit of a timed() executor (epoch otherwise).
    [[nodiscard]] TimePoint time_limit() const noexcept { return time_limit_; }

    /// @brief Step limit of a steps() executor (0 otherwise).
    [[nodiscard]] std::size_t step_limit() const noexcept { return step_limit_; }

    [[nodiscard]] bool has_side_effect() const noexcept { return static_cast<bool>(side_effect_); }

private:
    explicit Executor(EndCondition end_condition) noexcept
        : end_condition_(end_condition) {}

    bool step(Simulation& sim) const;

    EndCondition end_condition_;
    TimePoint time_limit_{};
    std::size_t step_limit_{0};
    StopPredicate predicate_;
    Simulation::SideEffect side_effect_;
};

} // namespace evsim::core
