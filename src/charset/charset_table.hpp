#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace vsnsl {

using Code = uint32_t;

struct CharsetInfo {
    std::string author;
    double timestamp = 0.0;
};

// Immutable bijection between code points and fixed-width decimal codes.
// Safe to share read-only between threads once constructed.
class CharsetTable {
public:
    static constexpr size_t MAX_CODE_WIDTH = 10;

    // code_width == 0 derives the width from the largest code.
    // Throws InvalidTableError if the mapping is empty, not injective,
    // or does not fit in code_width digits.
    explicit CharsetTable(std::unordered_map<char32_t, Code> mapping,
                          size_t code_width = 0,
                          CharsetInfo info = {});

    Code lookup_code(char32_t ch) const;    // throws UnknownCharacterError
    char32_t lookup_char(Code code) const;  // throws UnknownCodeError

    std::optional<Code> find_code(char32_t ch) const noexcept;
    std::optional<char32_t> find_char(Code code) const noexcept;

    bool contains(char32_t ch) const noexcept { return char_to_code_.count(ch) != 0; }
    bool contains_digits() const noexcept;

    size_t code_width() const noexcept { return code_width_; }
    size_t size() const noexcept { return char_to_code_.size(); }
    Code max_code() const noexcept { return max_code_; }

    // Exclusive upper bound for any locked code: 10^code_width.
    uint64_t code_limit() const noexcept { return code_limit_; }

    const CharsetInfo& info() const noexcept { return info_; }

    std::vector<std::pair<Code, char32_t>> entries() const;  // sorted by code

    static size_t digit_width(uint64_t value) noexcept;

private:
    std::unordered_map<char32_t, Code> char_to_code_;
    std::unordered_map<Code, char32_t> code_to_char_;
    size_t code_width_ = 0;
    uint64_t code_limit_ = 1;
    Code max_code_ = 0;
    CharsetInfo info_;
};

} // namespace vsnsl
