#include "utf8.hpp"
#include <cstdint>

namespace vsnsl::utf8 {

std::vector<char32_t> decode(std::string_view text) {
    std::vector<char32_t> cps;
    cps.reserve(text.size());

    const auto* p = reinterpret_cast<const uint8_t*>(text.data());
    const auto* end = p + text.size();

    auto is_cont = [](uint8_t b) { return (b & 0xC0) == 0x80; };

    while (p < end) {
        uint32_t cp;

        if (*p < 0x80) {
            cp = *p++;
        } else if ((*p & 0xE0) == 0xC0 && end - p >= 2 && is_cont(p[1])) {
            cp = ((p[0] & 0x1Fu) << 6) | (p[1] & 0x3Fu);
            p += 2;
            if (cp < 0x80) cp = REPLACEMENT_CHAR; // overlong
        } else if ((*p & 0xF0) == 0xE0 && end - p >= 3 && is_cont(p[1]) && is_cont(p[2])) {
            cp = ((p[0] & 0x0Fu) << 12) | ((p[1] & 0x3Fu) << 6) | (p[2] & 0x3Fu);
            p += 3;
            if (cp < 0x800 || (cp >= 0xD800 && cp <= 0xDFFF)) cp = REPLACEMENT_CHAR;
        } else if ((*p & 0xF8) == 0xF0 && end - p >= 4 && is_cont(p[1]) && is_cont(p[2]) &&
                   is_cont(p[3])) {
            cp = ((p[0] & 0x07u) << 18) | ((p[1] & 0x3Fu) << 12) | ((p[2] & 0x3Fu) << 6) |
                 (p[3] & 0x3Fu);
            p += 4;
            if (cp < 0x10000 || cp > 0x10FFFF) cp = REPLACEMENT_CHAR;
        } else {
            // Bad lead byte or truncated sequence
            cp = REPLACEMENT_CHAR;
            ++p;
        }

        cps.push_back(static_cast<char32_t>(cp));
    }

    return cps;
}

void append(std::string& out, char32_t ch) {
    auto cp = static_cast<uint32_t>(ch);
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string encode(char32_t cp) {
    std::string out;
    append(out, cp);
    return out;
}

std::string encode(const std::vector<char32_t>& cps) {
    std::string out;
    out.reserve(cps.size());
    for (char32_t cp : cps) {
        append(out, cp);
    }
    return out;
}

} // namespace vsnsl::utf8
