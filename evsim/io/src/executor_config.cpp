#include <evsim/io/executor_config.hpp>
#include <evsim/io/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <fstream>
#include <sstream>
#include <string>

namespace evsim::io {

namespace {

constexpr const char* CONTEXT = "executor";

const rapidjson::Value& get_member(const rapidjson::Value& obj, const char* name) {
    if (!obj.HasMember(name)) {
        throw LoaderError(std::string("missing required field '") + name + "'", CONTEXT);
    }
    return obj[name];
}

double get_non_negative_double(const rapidjson::Value& obj, const char* name) {
    const auto& member = get_member(obj, name);
    if (!member.IsNumber()) {
        throw LoaderError(std::string("field '") + name + "' must be a number", CONTEXT);
    }
    double value = member.GetDouble();
    if (value < 0.0) {
        throw LoaderError(std::string("field '") + name + "' must be non-negative", CONTEXT);
    }
    return value;
}

uint64_t get_uint64(const rapidjson::Value& obj, const char* name) {
    const auto& member = get_member(obj, name);
    if (!member.IsUint64()) {
        throw LoaderError(std::string("field '") + name + "' must be a non-negative integer", CONTEXT);
    }
    return member.GetUint64();
}

ExecutorConfig::Mode parse_mode(const rapidjson::Value& obj) {
    const auto& member = get_member(obj, "mode");
    if (!member.IsString()) {
        throw LoaderError("field 'mode' must be a string", CONTEXT);
    }
    std::string_view mode(member.GetString(), member.GetStringLength());
    if (mode == "unbound") {
        return ExecutorConfig::Mode::Unbound;
    }
    if (mode == "timed") {
        return ExecutorConfig::Mode::Timed;
    }
    if (mode == "steps") {
        return ExecutorConfig::Mode::Steps;
    }
    throw LoaderError("unknown mode '" + std::string(mode) + "'", CONTEXT);
}

const char* mode_name(ExecutorConfig::Mode mode) {
    switch (mode) {
    case ExecutorConfig::Mode::Timed:
        return "timed";
    case ExecutorConfig::Mode::Steps:
        return "steps";
    case ExecutorConfig::Mode::Unbound:
        break;
    }
    return "unbound";
}

} // namespace

ExecutorConfig load_executor_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_executor_config_from_string(oss.str());
}

ExecutorConfig load_executor_config_from_string(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }

    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", CONTEXT);
    }

    ExecutorConfig config;
    config.mode = parse_mode(doc);

    switch (config.mode) {
    case ExecutorConfig::Mode::Timed:
        config.until = core::time_from_seconds(get_non_negative_double(doc, "until"));
        break;
    case ExecutorConfig::Mode::Steps:
        config.steps = static_cast<std::size_t>(get_uint64(doc, "steps"));
        break;
    case ExecutorConfig::Mode::Unbound:
        break;
    }

    return config;
}

void write_executor_config_to_stream(const ExecutorConfig& config, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    writer.Key("mode");
    writer.String(mode_name(config.mode));

    if (config.mode == ExecutorConfig::Mode::Timed) {
        writer.Key("until");
        writer.Double(core::time_to_seconds(config.until));
    } else if (config.mode == ExecutorConfig::Mode::Steps) {
        writer.Key("steps");
        writer.Uint64(config.steps);
    }

    writer.EndObject();

    out << buffer.GetString();
}

core::Executor make_executor(const ExecutorConfig& config) {
    switch (config.mode) {
    case ExecutorConfig::Mode::Timed:
        return core::Executor::timed(config.until);
    case ExecutorConfig::Mode::Steps:
        return core::Executor::steps(config.steps);
    case ExecutorConfig::Mode::Unbound:
        break;
    }
    return core::Executor::unbound();
}

} // namespace evsim::io
