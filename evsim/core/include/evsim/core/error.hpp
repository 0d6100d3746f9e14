#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace evsim::core {

/// @brief Base exception for all simulation errors.
///
/// All exceptions thrown by the core library derive from this class,
/// allowing callers to catch simulation-specific errors separately
/// from other `std::runtime_error` exceptions.
///
/// Queue overflow is not reported through exceptions; see PushResult.
///
/// @see InvalidArgumentError
/// @ingroup core
class SimulationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Thrown when an API argument is unusable.
///
/// For example, an executor built from an empty stop predicate or a null
/// shared component.
///
/// @see SimulationError
/// @ingroup core
class InvalidArgumentError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

namespace detail {

/// @brief Report a broken kernel invariant on stderr and abort the process.
///
/// Reached only when a typed handle is used against storage it was not
/// minted from (unknown component, payload of the wrong type, unknown
/// queue). These are programming errors and are never turned into
/// exceptions.
[[noreturn]] void invariant_failure(std::string_view what) noexcept;

} // namespace detail

} // namespace evsim::core
