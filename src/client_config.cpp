#include "client_config.hpp"
#include "errors.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

#include <boost/system/error_code.hpp>

namespace {

const json::object& require_object(const json::object& obj, std::string_view key) {
    const json::value* v = obj.if_contains(key);
    if (v == nullptr || !v->is_object()) {
        throw ValidationError("Config section '" + std::string(key) + "' must be an object");
    }
    return v->as_object();
}

std::string read_string(const json::object& obj, std::string_view key, const std::string& fallback) {
    const json::value* v = obj.if_contains(key);
    if (v == nullptr) {
        return fallback;
    }
    if (!v->is_string()) {
        throw ValidationError("Config field '" + std::string(key) + "' must be a string");
    }
    return std::string(v->as_string());
}

int64_t read_int(const json::object& obj, std::string_view key, int64_t fallback) {
    const json::value* v = obj.if_contains(key);
    if (v == nullptr) {
        return fallback;
    }
    if (v->is_int64()) {
        return v->as_int64();
    }
    if (v->is_uint64() && v->as_uint64() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return static_cast<int64_t>(v->as_uint64());
    }
    if (v->is_uint64()) {
        throw ValidationError("Config field '" + std::string(key) + "' is out of range");
    }
    throw ValidationError("Config field '" + std::string(key) + "' must be an integer");
}

// Narrowing read for int fields; values that do not fit are rejected, never truncated.
int read_int32(const json::object& obj, std::string_view key, int fallback) {
    int64_t value = read_int(obj, key, fallback);
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw ValidationError("Config field '" + std::string(key) + "' is out of range");
    }
    return static_cast<int>(value);
}

bool read_bool(const json::object& obj, std::string_view key, bool fallback) {
    const json::value* v = obj.if_contains(key);
    if (v == nullptr) {
        return fallback;
    }
    if (!v->is_bool()) {
        throw ValidationError("Config field '" + std::string(key) + "' must be a boolean");
    }
    return v->as_bool();
}

} // namespace

void ClientConfig::validate() const {
    if (host.empty()) {
        throw ValidationError("API host cannot be empty");
    }
    if (port <= 0 || port > 65535) {
        throw ValidationError("API port must be a valid port number (1-65535)");
    }
    if (api_key.empty()) {
        throw ValidationError("API key cannot be empty");
    }
    if (request_timeout.count() <= 0) {
        throw ValidationError("Request timeout must be positive");
    }
    if (retry_attempts < 0) {
        throw ValidationError("Retry attempts cannot be negative");
    }
    if (retry_delay.count() < 0) {
        throw ValidationError("Retry delay cannot be negative");
    }
}

ClientConfig ClientConfig::from_json(const json::object& obj) {
    ClientConfig config;
    config.host = read_string(obj, "host", config.host);
    config.port = read_int32(obj, "port", config.port);
    config.target = read_string(obj, "target", config.target);
    config.api_key = read_string(obj, "api_key", config.api_key);
    config.request_timeout = std::chrono::milliseconds(read_int(obj, "request_timeout_ms", config.request_timeout.count()));
    config.retry_attempts = read_int32(obj, "retry_attempts", config.retry_attempts);
    config.retry_delay = std::chrono::milliseconds(read_int(obj, "retry_delay_ms", config.retry_delay.count()));
    config.validate();
    return config;
}

LoggerConfig logger_config_from_json(const json::object& obj) {
    LoggerConfig config;
    config.name = read_string(obj, "name", config.name);
    config.file_path = read_string(obj, "file", config.file_path);
    config.console = read_bool(obj, "console", config.console);
    if (obj.contains("level")) {
        config.level = parse_log_level(read_string(obj, "level", "info"));
    }
    return config;
}

GatewayConfig load_config_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ValidationError("Cannot open config file: " + path);
    }
    std::stringstream ss;
    ss << in.rdbuf();

    boost::system::error_code ec;
    json::value parsed = json::parse(ss.str(), ec);
    if (ec) {
        throw ValidationError("Config file " + path + " is not valid JSON: " + ec.message());
    }
    if (!parsed.is_object()) {
        throw ValidationError("Config file " + path + " must contain a JSON object");
    }
    const auto& root = parsed.as_object();

    GatewayConfig config;
    config.client = ClientConfig::from_json(require_object(root, "client"));
    if (root.contains("log")) {
        config.log = logger_config_from_json(require_object(root, "log"));
    }
    if (const json::value* markets = root.if_contains("markets")) {
        if (!markets->is_array()) {
            throw ValidationError("Config field 'markets' must be an array");
        }
        config.markets = markets->as_array();
    }
    return config;
}
