#include "batch_codec.hpp"
#include "../common/errors.hpp"

namespace vsnsl {

template <typename Fn>
std::vector<std::string> BatchCodec::run(const char* op, const std::vector<std::string>& items,
                                         bool items_encoded, Fn&& fn) const {
    // Surface a missing table as itself, not as a failure of item 0
    const auto& table = codec_.table();

    std::vector<std::string> results;
    results.reserve(items.size());

    size_t codes = 0;
    for (size_t i = 0; i < items.size(); ++i) {
        try {
            results.push_back(fn(items[i]));
        } catch (const CodecError& e) {
            BatchItemError error(i, e, std::current_exception());
            log_codec_event(codec_.sink(), LogLevel::Warn, op, false, codes, codes,
                            error.what());
            throw error;
        }
        const std::string& encoded = items_encoded ? items[i] : results.back();
        codes += encoded.size() / table.code_width();
    }

    log_codec_event(codec_.sink(), LogLevel::Info, op, true, codes, codes);
    return results;
}

std::vector<std::string> BatchCodec::encode_batch(const std::vector<std::string>& texts,
                                                  Lock lock) const {
    return run("encode_batch", texts, false,
               [&](const std::string& text) { return codec_.encode_raw(text, lock); });
}

std::vector<std::string> BatchCodec::decode_batch(const std::vector<std::string>& encoded,
                                                  Lock lock) const {
    return run("decode_batch", encoded, true,
               [&](const std::string& data) { return codec_.decode_raw(data, lock); });
}

} // namespace vsnsl
