#include "multi_lock_codec.hpp"
#include "../common/errors.hpp"
#include <fmt/format.h>

namespace vsnsl {

void MultiLockCodec::check_locks(const std::vector<Lock>& locks) const {
    if (locks.empty()) {
        throw EmptyLockSequenceError();
    }

    const auto& table = codec_.table();
    if (locks.size() > 1) {
        for (char32_t d = U'0'; d <= U'9'; ++d) {
            if (!table.contains(d)) {
                throw UnknownCharacterError(d);
            }
        }
    }
}

std::string MultiLockCodec::multi_encode(const std::vector<Lock>& locks,
                                         std::string_view text) const {
    try {
        check_locks(locks);

        std::string result(text);
        for (Lock lock : locks) {
            result = codec_.encode_raw(result, lock);
        }

        size_t codes = result.size() / codec_.table().code_width();
        log_codec_event(codec_.sink(), LogLevel::Debug, "multi_encode", true, codes, codes,
                        fmt::format("layers={}", locks.size()));
        return result;
    } catch (const CodecError& e) {
        log_codec_event(codec_.sink(), LogLevel::Warn, "multi_encode", false, 0, 0, e.what());
        throw;
    }
}

std::string MultiLockCodec::multi_decode(const std::vector<Lock>& locks,
                                         std::string_view encoded) const {
    try {
        if (locks.empty()) {
            throw EmptyLockSequenceError();
        }

        std::string result(encoded);
        for (auto it = locks.rbegin(); it != locks.rend(); ++it) {
            result = codec_.decode_raw(result, *it);
        }

        size_t codes = encoded.size() / codec_.table().code_width();
        log_codec_event(codec_.sink(), LogLevel::Debug, "multi_decode", true, codes, codes,
                        fmt::format("layers={}", locks.size()));
        return result;
    } catch (const CodecError& e) {
        log_codec_event(codec_.sink(), LogLevel::Warn, "multi_decode", false, 0, 0, e.what());
        throw;
    }
}

} // namespace vsnsl
