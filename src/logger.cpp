#include "logger.hpp"
#include "errors.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace {
std::mutex backend_mutex;
}

quill::LogLevel parse_log_level(std::string_view name) {
    if (name == "trace_l3") return quill::LogLevel::TraceL3;
    if (name == "trace_l2") return quill::LogLevel::TraceL2;
    if (name == "trace_l1") return quill::LogLevel::TraceL1;
    if (name == "debug") return quill::LogLevel::Debug;
    if (name == "info") return quill::LogLevel::Info;
    if (name == "warning") return quill::LogLevel::Warning;
    if (name == "error") return quill::LogLevel::Error;
    if (name == "critical") return quill::LogLevel::Critical;
    throw ValidationError("Unknown log level: " + std::string(name));
}

Logger::Logger(const LoggerConfig& config) {
    if (config.name.empty()) {
        throw ValidationError("Logger name cannot be empty");
    }
    if (config.file_path.empty() && !config.console) {
        throw ValidationError("Logger needs at least one sink (file or console)");
    }
    try {
        {
            std::lock_guard<std::mutex> lock(backend_mutex);
            if (!quill::Backend::is_running()) {
                quill::Backend::start(quill::BackendOptions{});
            }
        }

        quill::PatternFormatterOptions formatter_options;
        formatter_options.format_pattern = "%(time) [%(log_level)] %(file_name): %(message)";
        formatter_options.timestamp_pattern = "%Y-%m-%d %H:%M:%S.%Qus";
        formatter_options.timestamp_timezone = quill::Timezone::LocalTime;

        std::vector<std::shared_ptr<quill::Sink>> sinks;

        if (!config.file_path.empty()) {
            std::filesystem::path file_path(config.file_path);
            if (auto parent = file_path.parent_path(); !parent.empty()) {
                std::filesystem::create_directories(parent);
            }

            quill::FileSinkConfig file_cfg;
            file_cfg.set_open_mode('a');
            file_cfg.set_filename_append_option(quill::FilenameAppendOption::StartDateTime);

            sinks.push_back(quill::Frontend::create_or_get_sink<quill::FileSink>(
                config.file_path, file_cfg, quill::FileEventNotifier{}));
        }

        if (config.console) {
            sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>(config.name + "_console"));
        }

        logger_ = quill::Frontend::create_or_get_logger(config.name, std::move(sinks), formatter_options);
        logger_->set_log_level(config.level);

    } catch (const std::exception& e) {
        throw std::runtime_error("Logger initialization failed: " + std::string(e.what()));
    }
}

Logger::~Logger() {
    if (logger_ != nullptr && quill::Backend::is_running()) {
        logger_->flush_log();
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (quill::Backend::is_running()) {
        quill::Backend::stop();
    }
}
