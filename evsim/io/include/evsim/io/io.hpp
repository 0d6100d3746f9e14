#pragma once

/// @defgroup io I/O Library
/// @brief Trace output and JSON run configuration.
///
/// The I/O library handles external data formats: writing simulation
/// traces (JSON, in-memory) and loading executor policies from
/// JSON files. Depends on core only.

/// @defgroup io_loaders Loaders
/// @ingroup io
/// @brief Executor configuration loader.

/// @defgroup io_writers Trace Writers
/// @ingroup io
/// @brief JSON, memory and null trace writers.

// Convenience header for the I/O library

#include <evsim/io/error.hpp>
#include <evsim/io/executor_config.hpp>
#include <evsim/io/trace_writers.hpp>
