#pragma once

#include "log_sink.hpp"
#include "config.hpp"
#include <memory>
#include <string>

namespace spdlog {
    class logger;
}

namespace vsnsl {

class SpdlogSink final : public LogSink {
public:
    explicit SpdlogSink(std::shared_ptr<spdlog::logger> logger);

    void log(LogLevel level, std::string_view message) override;
    bool enabled(LogLevel level) const override;

    const std::shared_ptr<spdlog::logger>& logger() const { return logger_; }

private:
    std::shared_ptr<spdlog::logger> logger_;
};

// Rotating activity log plus optional console output.
std::shared_ptr<spdlog::logger> make_logger(const std::string& name, const LoggingConfig& config);

} // namespace vsnsl
