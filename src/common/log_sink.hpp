#pragma once

#include <cstdint>
#include <string_view>

namespace vsnsl {

enum class LogLevel : uint8_t { Debug, Info, Warn, Error };

// The only logging capability the codec core depends on.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void log(LogLevel level, std::string_view message) = 0;
    virtual bool enabled(LogLevel level) const { return true; }
};

class NullLogSink final : public LogSink {
public:
    void log(LogLevel, std::string_view) override {}
    bool enabled(LogLevel) const override { return false; }

    static NullLogSink& instance() {
        static NullLogSink sink;
        return sink;
    }
};

} // namespace vsnsl
