#pragma once

/// @file executor_config.hpp
/// @brief Loading and writing executor run policies as JSON.
/// @ingroup io_loaders

#include <evsim/core/executor.hpp>
#include <evsim/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string_view>

namespace evsim::io {

/// @brief Serialisable description of an executor policy.
///
/// JSON layout:
/// @code{.json}
/// { "mode": "timed", "until": 6.0 }
/// { "mode": "steps", "steps": 100 }
/// { "mode": "unbound" }
/// @endcode
///
/// `until` is expressed in seconds since the epoch. Fields not used by
/// the selected mode are ignored when loading and omitted when writing.
///
/// @ingroup io_loaders
/// @see load_executor_config, make_executor
struct ExecutorConfig {
    enum class Mode : std::uint8_t {
        Unbound,
        Timed,
        Steps,
    };

    Mode mode{Mode::Unbound};
    core::TimePoint until{};  ///< Time limit, used by Mode::Timed.
    std::size_t steps{0};     ///< Step limit, used by Mode::Steps.
};

/// @brief Load an executor configuration from a JSON file.
///
/// @throws LoaderError  If the file cannot be read or fails validation.
ExecutorConfig load_executor_config(const std::filesystem::path& path);

/// @brief Load an executor configuration from a JSON string.
///
/// @throws LoaderError  If the JSON is malformed, `mode` is missing or
///                      unknown, or the field required by the mode is
///                      missing or of the wrong type.
ExecutorConfig load_executor_config_from_string(std::string_view json);

/// @brief Write @p config as compact JSON to @p out.
void write_executor_config_to_stream(const ExecutorConfig& config, std::ostream& out);

/// @brief Build the core::Executor described by @p config.
[[nodiscard]] core::Executor make_executor(const ExecutorConfig& config);

} // namespace evsim::io
