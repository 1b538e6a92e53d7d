#include "spdlog_sink.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace vsnsl {

namespace {

spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info:  return spdlog::level::info;
        case LogLevel::Warn:  return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
    }
    return spdlog::level::info;
}

} // namespace

SpdlogSink::SpdlogSink(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {
    if (!logger_) {
        logger_ = spdlog::default_logger();
    }
}

void SpdlogSink::log(LogLevel level, std::string_view message) {
    logger_->log(to_spdlog(level), "{}", message);
}

bool SpdlogSink::enabled(LogLevel level) const {
    return logger_->should_log(to_spdlog(level));
}

std::shared_ptr<spdlog::logger> make_logger(const std::string& name, const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    try {
        if (!config.file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file, config.max_bytes, config.backup_count));
        }
    } catch (const spdlog::spdlog_ex& e) {
        throw ConfigError(std::string("cannot open log file: ") + e.what());
    }

    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());

    auto level = spdlog::level::from_str(config.level);
    if (level == spdlog::level::off && config.level != "off") {
        throw ConfigError("unknown log level '" + config.level + "'");
    }
    logger->set_level(level);
    logger->set_pattern(config.pattern);

    return logger;
}

} // namespace vsnsl
