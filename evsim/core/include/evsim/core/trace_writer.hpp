#pragma once

#include <evsim/core/types.hpp>

#include <cstdint>
#include <string_view>

namespace evsim::core {

/// @brief Sink for the records a Simulation emits while it runs.
/// @ingroup core
///
/// A record is written as `begin(time)`, `type(name)`, zero or more
/// `field()` calls, then `end()`. The kernel emits four record types:
///
/// | type                | fields                                   |
/// |---------------------|------------------------------------------|
/// | `component_added`   | `component_id`                           |
/// | `queue_added`       | `queue_id`                               |
/// | `event_dispatched`  | `component_id`, `sequence`, `pending`    |
/// | `executor_finished` | `steps`, `reason`                        |
///
/// Every field is an unsigned id or counter except `reason`, which is one
/// of `"empty"`, `"time_limit"`, `"step_limit"` or `"predicate"`.
/// Scheduling is not recorded.
///
/// @see Simulation::set_trace_writer()
class TraceWriter {
public:
    virtual ~TraceWriter() = default;

    /// @brief Open a record stamped with the current simulation time.
    virtual void begin(TimePoint time) = 0;

    virtual void type(std::string_view name) = 0;

    /// @brief Attach an id or counter.
    virtual void field(std::string_view key, uint64_t value) = 0;

    /// @brief Attach a symbolic value such as a stop reason.
    virtual void field(std::string_view key, std::string_view value) = 0;

    virtual void end() = 0;

protected:
    TraceWriter() = default;
    TraceWriter(const TraceWriter&) = default;
    TraceWriter& operator=(const TraceWriter&) = default;
    TraceWriter(TraceWriter&&) = default;
    TraceWriter& operator=(TraceWriter&&) = default;
};

} // namespace evsim::core
