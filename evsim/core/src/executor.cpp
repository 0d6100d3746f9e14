#include <evsim/core/executor.hpp>
#include <evsim/core/error.hpp>

#include <string_view>
#include <utility>

namespace evsim::core {

Executor Executor::unbound() {
    return Executor(EndCondition::EmptyQueue);
}

Executor Executor::timed(TimePoint until) {
    Executor executor(EndCondition::Time);
    executor.time_limit_ = until;
    return executor;
}

Executor Executor::steps(std::size_t steps) {
    Executor executor(EndCondition::Steps);
    executor.step_limit_ = steps;
    return executor;
}

Executor Executor::until(StopPredicate predicate) {
    if (!predicate) {
        throw InvalidArgumentError("Executor stop predicate must be callable");
    }
    Executor executor(EndCondition::Predicate);
    executor.predicate_ = std::move(predicate);
    return executor;
}

Executor Executor::side_effect(Simulation::SideEffect func) const {
    Executor executor(*this);
    executor.side_effect_ = std::move(func);
    return executor;
}

bool Executor::step(Simulation& sim) const {
    if (!sim.step()) {
        return false;
    }
    if (side_effect_) {
        side_effect_(sim);
    }
    return true;
}

std::size_t Executor::execute(Simulation& sim) const {
    std::size_t executed = 0;
    std::string_view reason = "empty";

    switch (end_condition_) {
    case EndCondition::EmptyQueue:
        while (step(sim)) {
            ++executed;
        }
        break;

    case EndCondition::Time:
        // Peek rather than pop so that the clock never passes the limit
        while (const EventEntry* next = sim.scheduler().peek()) {
            if (next->time() > time_limit_) {
                reason = "time_limit";
                break;
            }
            if (!step(sim)) {
                break;
            }
            ++executed;
        }
        break;

    case EndCondition::Steps:
        while (executed < step_limit_ && step(sim)) {
            ++executed;
        }
        if (executed == step_limit_ && !sim.scheduler().empty()) {
            reason = "step_limit";
        }
        break;

    case EndCondition::Predicate:
        while (true) {
            if (predicate_(sim)) {
                reason = "predicate";
                break;
            }
            if (!step(sim)) {
                break;
            }
            ++executed;
        }
        break;
    }

    sim.trace([&](TraceWriter& w) {
        w.type("executor_finished");
        w.field("steps", static_cast<uint64_t>(executed));
        w.field("reason", reason);
    });

    return executed;
}

} // namespace evsim::core
