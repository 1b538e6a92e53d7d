#include "charset_builder.hpp"
#include <algorithm>

namespace vsnsl {

CharsetBuilder::CharsetBuilder(const CharsetTable& table) : info_(table.info()) {
    merge(table);
}

Code CharsetBuilder::add_key(char32_t ch) {
    Code next = 0;
    if (!mapping_.empty()) {
        auto max_it = std::max_element(mapping_.begin(), mapping_.end(),
            [](const auto& a, const auto& b) { return a.second < b.second; });
        next = max_it->second + 1;
    }
    mapping_[ch] = next;
    return next;
}

CharsetBuilder& CharsetBuilder::set(char32_t ch, Code code) {
    mapping_[ch] = code;
    return *this;
}

bool CharsetBuilder::remove_key(char32_t ch) {
    return mapping_.erase(ch) != 0;
}

CharsetBuilder& CharsetBuilder::merge(const CharsetBuilder& other) {
    for (const auto& [ch, code] : other.mapping_) {
        mapping_.emplace(ch, code);
    }
    return *this;
}

CharsetBuilder& CharsetBuilder::merge(const CharsetTable& other) {
    for (const auto& [code, ch] : other.entries()) {
        mapping_.emplace(ch, code);
    }
    return *this;
}

CharsetBuilder& CharsetBuilder::set_info(CharsetInfo info) {
    info_ = std::move(info);
    return *this;
}

std::shared_ptr<const CharsetTable> CharsetBuilder::build(size_t code_width) const {
    return std::make_shared<const CharsetTable>(mapping_, code_width, info_);
}

} // namespace vsnsl
