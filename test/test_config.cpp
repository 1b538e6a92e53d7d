#include <gtest/gtest.h>
#include "common/config.hpp"
#include "common/errors.hpp"
#include <limits>

using namespace vsnsl;

TEST(ConfigTest, Defaults) {
    auto config = Config::default_config();
    EXPECT_EQ(config.charset.path, "resources/charsets");
    EXPECT_EQ(config.charset.code_offset, 100u);
    EXPECT_EQ(config.charset.code_width, 0u);
    ASSERT_TRUE(config.codec.default_lock.has_value());
    EXPECT_EQ(*config.codec.default_lock, 1);
    EXPECT_EQ(config.logging.level, "info");
    EXPECT_EQ(config.logging.max_bytes, 5u * 1024 * 1024);
    EXPECT_EQ(config.logging.backup_count, 5u);
}

TEST(ConfigTest, MissingFileYieldsDefaults) {
    auto config = Config::load_from_file("/nonexistent/vsnsl.json");
    EXPECT_EQ(config.charset.path, "resources/charsets");
    EXPECT_EQ(config.logging.file, "logs/activity.log");
}

TEST(ConfigTest, OverridesPresentKeysOnly) {
    auto config = Config::load_from_string(R"({
        "charset": {"path": "/etc/vsnsl/charsets", "code_width": 4},
        "codec": {"default_lock": -7},
        "logging": {"level": "debug", "console": false}
    })");

    EXPECT_EQ(config.charset.path, "/etc/vsnsl/charsets");
    EXPECT_EQ(config.charset.code_width, 4u);
    EXPECT_EQ(config.charset.code_offset, 100u);
    EXPECT_EQ(config.codec.default_lock, -7);
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_FALSE(config.logging.console);
    EXPECT_EQ(config.logging.backup_count, 5u);
}

TEST(ConfigTest, NullDefaultLockDisablesIt) {
    auto config = Config::load_from_string(R"({"codec": {"default_lock": null}})");
    EXPECT_FALSE(config.codec.default_lock.has_value());
}

TEST(ConfigTest, MalformedJsonThrows) {
    EXPECT_THROW(Config::load_from_string("{not json"), ConfigError);
    EXPECT_THROW(Config::load_from_string("[1, 2]"), ConfigError);
}

TEST(ConfigTest, WrongTypesThrow) {
    EXPECT_THROW(Config::load_from_string(R"({"charset": {"code_width": "three"}})"), ConfigError);
    EXPECT_THROW(Config::load_from_string(R"({"logging": {"console": "yes"}})"), ConfigError);

    try {
        Config::load_from_string(R"({"codec": {"default_lock": "1"}})");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.category(), ErrorCategory::Configuration);
    }
}

TEST(ConfigTest, NegativeAndFractionalNumbersThrow) {
    EXPECT_THROW(Config::load_from_string(R"({"charset": {"code_offset": -1}})"), ConfigError);
    EXPECT_THROW(Config::load_from_string(R"({"charset": {"code_width": -2}})"), ConfigError);
    EXPECT_THROW(Config::load_from_string(R"({"charset": {"code_width": 4294967296}})"), ConfigError);
    EXPECT_THROW(Config::load_from_string(R"({"logging": {"backup_count": -1}})"), ConfigError);
    EXPECT_THROW(Config::load_from_string(R"({"logging": {"max_bytes": 1.5}})"), ConfigError);
    EXPECT_THROW(Config::load_from_string(R"({"codec": {"default_lock": 1.9}})"), ConfigError);
    EXPECT_THROW(Config::load_from_string(R"({"codec": {"default_lock": 18446744073709551615}})"),
                 ConfigError);
}

TEST(ConfigTest, IntegerBoundsAreAccepted) {
    auto config = Config::load_from_string(R"({
        "charset": {"code_offset": 0, "code_width": 4294967295},
        "codec": {"default_lock": -9223372036854775808}
    })");
    EXPECT_EQ(config.charset.code_offset, 0u);
    EXPECT_EQ(config.charset.code_width, 4294967295u);
    EXPECT_EQ(*config.codec.default_lock, std::numeric_limits<int64_t>::min());
}
