#include "charset_table.hpp"
#include "../common/errors.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace vsnsl {

CharsetTable::CharsetTable(std::unordered_map<char32_t, Code> mapping,
                           size_t code_width,
                           CharsetInfo info)
    : char_to_code_(std::move(mapping)), info_(std::move(info)) {
    if (char_to_code_.empty()) {
        throw InvalidTableError("mapping is empty");
    }

    code_to_char_.reserve(char_to_code_.size());
    for (const auto& [ch, code] : char_to_code_) {
        auto [it, inserted] = code_to_char_.emplace(code, ch);
        if (!inserted) {
            throw InvalidTableError(fmt::format("code {} is shared by {} and {}",
                                                code, describe_char(it->second),
                                                describe_char(ch)));
        }
        max_code_ = std::max(max_code_, code);
    }

    size_t required = digit_width(max_code_);
    if (code_width == 0) {
        code_width = required;
    } else if (code_width < required) {
        throw InvalidTableError(fmt::format("largest code {} needs {} digits, width is {}",
                                            max_code_, required, code_width));
    }
    if (code_width > MAX_CODE_WIDTH) {
        throw InvalidTableError(fmt::format("code width {} exceeds {}", code_width,
                                            MAX_CODE_WIDTH));
    }

    code_width_ = code_width;
    for (size_t i = 0; i < code_width_; ++i) {
        code_limit_ *= 10;
    }
}

Code CharsetTable::lookup_code(char32_t ch) const {
    auto it = char_to_code_.find(ch);
    if (it == char_to_code_.end()) {
        throw UnknownCharacterError(ch);
    }
    return it->second;
}

char32_t CharsetTable::lookup_char(Code code) const {
    auto it = code_to_char_.find(code);
    if (it == code_to_char_.end()) {
        throw UnknownCodeError(code);
    }
    return it->second;
}

std::optional<Code> CharsetTable::find_code(char32_t ch) const noexcept {
    auto it = char_to_code_.find(ch);
    if (it == char_to_code_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<char32_t> CharsetTable::find_char(Code code) const noexcept {
    auto it = code_to_char_.find(code);
    if (it == code_to_char_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool CharsetTable::contains_digits() const noexcept {
    for (char32_t d = U'0'; d <= U'9'; ++d) {
        if (!contains(d)) {
            return false;
        }
    }
    return true;
}

std::vector<std::pair<Code, char32_t>> CharsetTable::entries() const {
    std::vector<std::pair<Code, char32_t>> result(code_to_char_.begin(), code_to_char_.end());
    std::sort(result.begin(), result.end());
    return result;
}

size_t CharsetTable::digit_width(uint64_t value) noexcept {
    size_t width = 1;
    while (value >= 10) {
        value /= 10;
        ++width;
    }
    return width;
}

} // namespace vsnsl
