#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace vsnsl::utf8 {

constexpr char32_t REPLACEMENT_CHAR = 0xFFFD;

// Invalid or truncated sequences come back as U+FFFD, one per bad byte.
std::vector<char32_t> decode(std::string_view text);

void append(std::string& out, char32_t cp);
std::string encode(char32_t cp);
std::string encode(const std::vector<char32_t>& cps);

} // namespace vsnsl::utf8
