#pragma once

#include <chrono>
#include <string>

#include <boost/json.hpp>

#include "logger.hpp"

namespace json = boost::json;

struct ClientConfig {
    std::string host;
    int port = 0;
    std::string target = "/ws";
    std::string api_key;
    std::chrono::milliseconds request_timeout{5000};
    int retry_attempts = 3;
    std::chrono::milliseconds retry_delay{500};

    // Throws ValidationError describing the first invalid field.
    void validate() const;

    /**
     * @brief Builds a validated config from a JSON object.
     *
     * Keys: host, port, target, api_key, request_timeout_ms, retry_attempts, retry_delay_ms.
     * Missing optional keys keep their defaults.
     */
    static ClientConfig from_json(const json::object& obj);
};

// Reads "level", "file" and "console" from the "log" section.
LoggerConfig logger_config_from_json(const json::object& obj);

struct GatewayConfig {
    ClientConfig client;
    LoggerConfig log;
    json::array markets;   // [{"exchange": ..., "market": ...}, ...] subscribed at startup
};

/**
 * @brief Loads {"client": {...}, "log": {...}, "markets": [...]} from a file.
 * @throws ValidationError if the file cannot be read, is not valid JSON or fails validation.
 */
GatewayConfig load_config_file(const std::string& path);
