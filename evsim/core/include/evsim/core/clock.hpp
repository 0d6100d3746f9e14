#pragma once

#include <evsim/core/types.hpp>

#include <memory>
#include <utility>

namespace evsim::core {

class Scheduler;

/// @brief Read-only view of the simulation clock.
/// @ingroup core_engine
///
/// The clock cell is owned by the Scheduler, which is the only writer.
/// Any number of ClockRef copies may be handed to components or to
/// outside observers; each read returns the latest time. A ClockRef
/// shares ownership of the cell, so it stays readable after the
/// Scheduler has been destroyed.
///
/// @see Scheduler::clock
class ClockRef {
    friend class Scheduler;

public:
    /// @brief Current simulation time.
    [[nodiscard]] TimePoint time() const noexcept { return *cell_; }

private:
    explicit ClockRef(std::shared_ptr<const TimePoint> cell) noexcept
        : cell_(std::move(cell)) {}

    std::shared_ptr<const TimePoint> cell_;
};

} // namespace evsim::core
