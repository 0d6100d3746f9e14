#include <evsim/io/trace_writers.hpp>

#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/writer.h>

namespace evsim::io {

namespace {

rapidjson::SizeType json_length(std::string_view str) {
    return static_cast<rapidjson::SizeType>(str.size());
}

} // namespace

// =============================================================================
// JsonTraceWriter
// =============================================================================

struct JsonTraceWriter::Impl {
    explicit Impl(std::ostream& output)
        : stream(output)
        , writer(stream) {}

    rapidjson::OStreamWrapper stream;
    rapidjson::Writer<rapidjson::OStreamWrapper> writer;
};

JsonTraceWriter::JsonTraceWriter(std::ostream& output)
    : output_(output)
    , impl_(std::make_unique<Impl>(output)) {
    impl_->writer.StartArray();
}

JsonTraceWriter::~JsonTraceWriter() {
    finalize();
}

void JsonTraceWriter::begin(core::TimePoint time) {
    impl_->writer.StartObject();
    impl_->writer.Key("time");
    impl_->writer.Double(core::time_to_seconds(time));
}

void JsonTraceWriter::type(std::string_view name) {
    impl_->writer.Key("type");
    impl_->writer.String(name.data(), json_length(name));
}

void JsonTraceWriter::field(std::string_view key, uint64_t value) {
    impl_->writer.Key(key.data(), json_length(key));
    impl_->writer.Uint64(value);
}

void JsonTraceWriter::field(std::string_view key, std::string_view value) {
    impl_->writer.Key(key.data(), json_length(key));
    impl_->writer.String(value.data(), json_length(value));
}

void JsonTraceWriter::end() {
    impl_->writer.EndObject();
}

void JsonTraceWriter::finalize() {
    if (finalized_) {
        return;
    }
    impl_->writer.EndArray();
    output_ << '\n';
    output_.flush();
    finalized_ = true;
}

// =============================================================================
// TraceRecord
// =============================================================================

const TraceValue* TraceRecord::find(std::string_view key) const {
    for (const auto& [name, value] : fields) {
        if (name == key) {
            return &value;
        }
    }
    return nullptr;
}

std::optional<uint64_t> TraceRecord::number(std::string_view key) const {
    const TraceValue* value = find(key);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (const auto* n = std::get_if<uint64_t>(value)) {
        return *n;
    }
    return std::nullopt;
}

std::optional<std::string_view> TraceRecord::text(std::string_view key) const {
    const TraceValue* value = find(key);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (const auto* s = std::get_if<std::string>(value)) {
        return std::string_view{*s};
    }
    return std::nullopt;
}

// =============================================================================
// MemoryTraceWriter
// =============================================================================

void MemoryTraceWriter::begin(core::TimePoint time) {
    current_ = TraceRecord{};
    current_.time = time;
}

void MemoryTraceWriter::type(std::string_view name) {
    current_.type = std::string(name);
}

void MemoryTraceWriter::field(std::string_view key, uint64_t value) {
    current_.fields.emplace_back(std::string(key), value);
}

void MemoryTraceWriter::field(std::string_view key, std::string_view value) {
    current_.fields.emplace_back(std::string(key), std::string(value));
}

void MemoryTraceWriter::end() {
    records_.push_back(std::move(current_));
    current_ = TraceRecord{};
}

std::vector<const TraceRecord*> MemoryTraceWriter::records_of_type(std::string_view type) const {
    std::vector<const TraceRecord*> matches;
    for (const auto& record : records_) {
        if (record.type == type) {
            matches.push_back(&record);
        }
    }
    return matches;
}

std::vector<uint64_t> MemoryTraceWriter::dispatch_targets() const {
    std::vector<uint64_t> targets;
    for (const auto* record : records_of_type("event_dispatched")) {
        if (auto id = record->number("component_id")) {
            targets.push_back(*id);
        }
    }
    return targets;
}

} // namespace evsim::io
