#pragma once

#include "charset_table.hpp"
#include <memory>

namespace vsnsl {

// Mutable staging area for a charset; build() freezes it into a table.
class CharsetBuilder {
public:
    CharsetBuilder() = default;
    explicit CharsetBuilder(const CharsetTable& table);

    // Assigns max code + 1, or 0 when empty. Returns the assigned code.
    Code add_key(char32_t ch);
    CharsetBuilder& set(char32_t ch, Code code);
    bool remove_key(char32_t ch);

    // Adds entries from other whose character is not present yet.
    CharsetBuilder& merge(const CharsetBuilder& other);
    CharsetBuilder& merge(const CharsetTable& other);

    CharsetBuilder& set_info(CharsetInfo info);

    bool contains(char32_t ch) const { return mapping_.count(ch) != 0; }
    size_t size() const { return mapping_.size(); }
    const std::unordered_map<char32_t, Code>& mapping() const { return mapping_; }
    const CharsetInfo& info() const { return info_; }

    std::shared_ptr<const CharsetTable> build(size_t code_width = 0) const;

private:
    std::unordered_map<char32_t, Code> mapping_;
    CharsetInfo info_;
};

} // namespace vsnsl
