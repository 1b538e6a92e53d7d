#include "config.hpp"
#include "errors.hpp"
#include <fstream>
#include <limits>
#include <sstream>
#include <type_traits>
#include <nlohmann/json.hpp>

namespace vsnsl {

namespace {

// nlohmann's get<> static_casts any number, so check sign and range first.
template <typename T>
T get_integer(const nlohmann::json& j, const char* key) {
    const auto& value = j[key];
    if (!value.is_number_integer()) {
        throw ConfigError(std::string(key) + " must be an integer");
    }
    if constexpr (std::is_unsigned_v<T>) {
        if (value.is_number_unsigned()) {
            if (value.get<uint64_t>() > std::numeric_limits<T>::max()) {
                throw ConfigError(std::string(key) + " is out of range");
            }
            return static_cast<T>(value.get<uint64_t>());
        }
        // A signed-stored integer that is non-negative is fine too
        auto v = value.get<int64_t>();
        if (v < 0) {
            throw ConfigError(std::string(key) + " must not be negative");
        }
        if (static_cast<uint64_t>(v) > std::numeric_limits<T>::max()) {
            throw ConfigError(std::string(key) + " is out of range");
        }
        return static_cast<T>(v);
    } else {
        if (value.is_number_unsigned() &&
            value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
            throw ConfigError(std::string(key) + " is out of range");
        }
        auto v = value.get<int64_t>();
        if (v < std::numeric_limits<T>::min() || v > std::numeric_limits<T>::max()) {
            throw ConfigError(std::string(key) + " is out of range");
        }
        return static_cast<T>(v);
    }
}

Config from_json(const nlohmann::json& j) {
    Config config = Config::default_config();

    if (!j.is_object()) {
        throw ConfigError("top-level value must be an object");
    }

    try {
        if (j.contains("charset")) {
            auto& cs = j["charset"];
            if (cs.contains("path")) config.charset.path = cs["path"].get<std::string>();
            if (cs.contains("code_offset")) config.charset.code_offset = get_integer<uint32_t>(cs, "code_offset");
            if (cs.contains("code_width")) config.charset.code_width = get_integer<uint32_t>(cs, "code_width");
        }

        if (j.contains("codec")) {
            auto& codec = j["codec"];
            if (codec.contains("default_lock")) {
                if (codec["default_lock"].is_null()) {
                    config.codec.default_lock.reset();
                } else {
                    config.codec.default_lock = get_integer<int64_t>(codec, "default_lock");
                }
            }
        }

        if (j.contains("logging")) {
            auto& log = j["logging"];
            if (log.contains("level")) config.logging.level = log["level"].get<std::string>();
            if (log.contains("file")) config.logging.file = log["file"].get<std::string>();
            if (log.contains("max_bytes")) config.logging.max_bytes = get_integer<uint64_t>(log, "max_bytes");
            if (log.contains("backup_count")) config.logging.backup_count = get_integer<uint32_t>(log, "backup_count");
            if (log.contains("console")) config.logging.console = log["console"].get<bool>();
            if (log.contains("pattern")) config.logging.pattern = log["pattern"].get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(e.what());
    }

    return config;
}

} // namespace

Config Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return default_config(); // Return default if file doesn't exist
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_string(buffer.str());
}

Config Config::load_from_string(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(e.what());
    }
    return from_json(j);
}

Config Config::default_config() {
    return Config{};
}

} // namespace vsnsl
