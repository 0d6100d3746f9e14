#pragma once

/// @file trace_writers.hpp
/// @brief TraceWriter implementations for simulation runs.
///
/// JsonTraceWriter streams the run as a JSON array, MemoryTraceWriter keeps
/// it for inspection after the run, and NullTraceWriter drops it.
///
/// @ingroup io_writers

#include <evsim/core/trace_writer.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace evsim::io {

/// @brief Discards every record.
/// @ingroup io_writers
class NullTraceWriter final : public core::TraceWriter {
public:
    void begin(core::TimePoint /*time*/) override {}
    void type(std::string_view /*name*/) override {}
    void field(std::string_view /*key*/, uint64_t /*value*/) override {}
    void field(std::string_view /*key*/, std::string_view /*value*/) override {}
    void end() override {}
};

/// @brief Streams records to @p output as one JSON array.
///
/// Each record becomes `{"time": <seconds>, "type": "<name>", <fields>...}`
/// with fields in emission order. Ids and counters are written as JSON
/// integers. The array is closed by @ref finalize or by the destructor.
///
/// @ingroup io_writers
/// @see MemoryTraceWriter
class JsonTraceWriter final : public core::TraceWriter {
public:
    /// @param output  Destination stream (must outlive this writer).
    explicit JsonTraceWriter(std::ostream& output);

    ~JsonTraceWriter() override;

    JsonTraceWriter(const JsonTraceWriter&) = delete;
    JsonTraceWriter& operator=(const JsonTraceWriter&) = delete;
    JsonTraceWriter(JsonTraceWriter&&) = delete;
    JsonTraceWriter& operator=(JsonTraceWriter&&) = delete;

    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    /// @brief Close the array, append a newline and flush.
    ///
    /// Only the first call writes.
    void finalize();

private:
    struct Impl;

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    std::unique_ptr<Impl> impl_;
    bool finalized_{false};
};

/// @brief Value of a recorded field: an id or counter, or a symbolic name.
using TraceValue = std::variant<uint64_t, std::string>;

/// @brief One record kept by MemoryTraceWriter.
/// @ingroup io_writers
struct TraceRecord {
    core::TimePoint time;
    std::string type;
    std::vector<std::pair<std::string, TraceValue>> fields;  ///< In emission order.

    /// @brief Field named @p key, or nullptr.
    [[nodiscard]] const TraceValue* find(std::string_view key) const;

    /// @brief Integer field named @p key; empty if absent or not an integer.
    [[nodiscard]] std::optional<uint64_t> number(std::string_view key) const;

    /// @brief String field named @p key; empty if absent or not a string.
    [[nodiscard]] std::optional<std::string_view> text(std::string_view key) const;
};

/// @brief Keeps every record of a run in memory.
///
/// Used by tests and by callers that inspect the dispatch order after a run.
///
/// @ingroup io_writers
class MemoryTraceWriter final : public core::TraceWriter {
public:
    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    [[nodiscard]] const std::vector<TraceRecord>& records() const { return records_; }

    /// @brief Records of the given type, in emission order.
    [[nodiscard]] std::vector<const TraceRecord*> records_of_type(std::string_view type) const;

    /// @brief Target component id of every `event_dispatched` record, in
    ///        dispatch order.
    [[nodiscard]] std::vector<uint64_t> dispatch_targets() const;

    void clear() { records_.clear(); }

private:
    std::vector<TraceRecord> records_;
    TraceRecord current_;
};

} // namespace evsim::io
