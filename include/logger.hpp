#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

#include <string>
#include <string_view>

struct LoggerConfig {
    std::string name = "liquid_energy";
    std::string file_path;          // empty = no file sink
    bool console = true;
    quill::LogLevel level = quill::LogLevel::Info;
};

/**
 * @brief Maps a lowercase level name ("debug", "info", "warning", ...) onto a quill level.
 * @throws ValidationError on an unknown name.
 */
quill::LogLevel parse_log_level(std::string_view name);

/**
 * @class Logger
 * @brief Thin owner of a quill logger, handed by reference to the components that log.
 *
 * Library code never reaches for a process-wide instance; whoever builds the components
 * builds the Logger and injects it.
 */
class Logger {
public:
    explicit Logger(const LoggerConfig& config = LoggerConfig{});
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    inline void log_info(const std::string& msg) { LOG_INFO(logger_, "{}", msg); }
    inline void log_warning(const std::string& msg) { LOG_WARNING(logger_, "{}", msg); }
    inline void log_error(const std::string& msg) { LOG_ERROR(logger_, "{}", msg); }
    inline void log_debug(const std::string& msg) { LOG_DEBUG(logger_, "{}", msg); }

    quill::Logger* quill_logger() { return logger_; }

    void set_level(quill::LogLevel level) { logger_->set_log_level(level); }

    void flush() { logger_->flush_log(); }

    // Stops the quill backend. Call once, after every Logger is done.
    static void shutdown();

private:
    quill::Logger* logger_ = nullptr;
};
