#pragma once

/// @defgroup core Core Library
/// @brief Discrete-event simulation kernel.
///
/// The core library provides the scheduler, the heterogeneous state
/// store with its queues, the component registry, the Simulation facade
/// and the Executor. It performs no I/O; trace writers and configuration
/// loading live in the io library.

/// @defgroup core_types Types
/// @ingroup core
/// @brief Strong types for simulation time.

/// @defgroup core_handles Handles
/// @ingroup core
/// @brief Typed identifiers for components, values and queues.

/// @defgroup core_engine Engine
/// @ingroup core
/// @brief Scheduler, clock, Simulation and Executor.

/// @defgroup core_events Events
/// @ingroup core
/// @brief Event entries and their ordering.

/// @defgroup core_components Components
/// @ingroup core
/// @brief Component interface and registry.

/// @defgroup core_state State
/// @ingroup core
/// @brief Value store and queue registry.

/// @defgroup core_queues Queues
/// @ingroup core
/// @brief Queue interface, FIFO and priority queues.

/// @defgroup core_internal Internals
/// @ingroup core
/// @brief Type erasure helpers.

#include <evsim/core/types.hpp>
#include <evsim/core/error.hpp>
#include <evsim/core/ids.hpp>
#include <evsim/core/clock.hpp>
#include <evsim/core/event_entry.hpp>
#include <evsim/core/queue.hpp>
#include <evsim/core/state.hpp>
#include <evsim/core/scheduler.hpp>
#include <evsim/core/component.hpp>
#include <evsim/core/trace_writer.hpp>
#include <evsim/core/simulation.hpp>
#include <evsim/core/executor.hpp>
