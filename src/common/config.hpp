#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace vsnsl {

struct CharsetConfig {
    std::string path = "resources/charsets";  // file or directory
    uint32_t code_offset = 100;
    uint32_t code_width = 0;                  // 0 = derive from largest code
};

struct CodecConfig {
    std::optional<int64_t> default_lock = 1;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file = "logs/activity.log";   // empty disables the file sink
    uint64_t max_bytes = 5 * 1024 * 1024;
    uint32_t backup_count = 5;
    bool console = true;
    std::string pattern = "%Y-%m-%d %H:%M:%S.%e - [%l] - %v";
};

struct Config {
    CharsetConfig charset;
    CodecConfig codec;
    LoggingConfig logging;

    static Config load_from_file(const std::string& path);
    static Config load_from_string(const std::string& text);
    static Config default_config();
};

} // namespace vsnsl
