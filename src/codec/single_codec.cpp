#include "single_codec.hpp"
#include "../common/errors.hpp"
#include "../common/utf8.hpp"
#include <iterator>
#include <fmt/format.h>

namespace vsnsl {

namespace {

bool lock_in_range(Lock lock, uint64_t limit) {
    auto bound = static_cast<int64_t>(limit);
    return lock > -bound && lock < bound;
}

} // namespace

void log_codec_event(LogSink& sink, LogLevel level, const char* op, bool ok,
                     size_t chars, size_t codes, std::string_view detail) {
    if (!sink.enabled(level)) {
        return;
    }
    if (detail.empty()) {
        sink.log(level, fmt::format("op={} status={} chars={} codes={}",
                                    op, ok ? "ok" : "error", chars, codes));
    } else {
        sink.log(level, fmt::format("op={} status={} chars={} codes={} detail=\"{}\"",
                                    op, ok ? "ok" : "error", chars, codes, detail));
    }
}

SingleCodec::SingleCodec(std::shared_ptr<const CharsetTable> table, LogSink* sink)
    : table_(std::move(table)), sink_(sink ? sink : &NullLogSink::instance()) {
}

const CharsetTable& SingleCodec::table() const {
    if (!table_) {
        throw TableNotInitializedError();
    }
    return *table_;
}

std::string SingleCodec::encode_raw(std::string_view text, Lock lock) const {
    const auto& tbl = table();
    const size_t width = tbl.code_width();
    const uint64_t limit = tbl.code_limit();

    auto cps = utf8::decode(text);

    std::string out;
    out.reserve(cps.size() * width);

    for (char32_t ch : cps) {
        Code code = tbl.lookup_code(ch);
        if (!lock_in_range(lock, limit)) {
            throw LockOverflowError(ch, code, lock, width);
        }
        int64_t locked = static_cast<int64_t>(code) + lock;
        if (locked < 0 || static_cast<uint64_t>(locked) >= limit) {
            throw LockOverflowError(ch, code, lock, width);
        }
        fmt::format_to(std::back_inserter(out), "{:0{}}", locked, width);
    }

    return out;
}

std::string SingleCodec::decode_raw(std::string_view encoded, Lock lock) const {
    const auto& tbl = table();
    const size_t width = tbl.code_width();
    const auto limit = static_cast<int64_t>(tbl.code_limit());

    if (encoded.size() % width != 0) {
        throw MalformedLengthError(encoded.size(), width);
    }

    std::string out;
    out.reserve(encoded.size() / width);

    for (size_t offset = 0; offset < encoded.size(); offset += width) {
        std::string_view group = encoded.substr(offset, width);

        int64_t value = 0;
        for (char c : group) {
            if (c < '0' || c > '9') {
                throw MalformedDigitsError(std::string(group), offset);
            }
            value = value * 10 + (c - '0');
        }

        // value - lock would overflow; no group decodes under such a lock
        if (lock <= -limit) {
            throw UnknownCodeError(value, lock);
        }
        int64_t code = value - lock;
        if (code < 0 || code > static_cast<int64_t>(tbl.max_code())) {
            throw UnknownCodeError(code);
        }
        utf8::append(out, tbl.lookup_char(static_cast<Code>(code)));
    }

    return out;
}

std::string SingleCodec::encode_data(std::string_view text, Lock lock) const {
    try {
        std::string out = encode_raw(text, lock);
        log_success("encode", out.size() / table_->code_width(), out.size() / table_->code_width());
        return out;
    } catch (const CodecError& e) {
        log_failure("encode", e);
        throw;
    }
}

std::string SingleCodec::decode_data(std::string_view encoded, Lock lock) const {
    try {
        std::string out = decode_raw(encoded, lock);
        size_t codes = encoded.size() / table_->code_width();
        log_success("decode", codes, codes);
        return out;
    } catch (const CodecError& e) {
        log_failure("decode", e);
        throw;
    }
}

std::string SingleCodec::convert_data(std::string_view encoded, Lock from_lock, Lock to_lock) const {
    try {
        std::string out = encode_raw(decode_raw(encoded, from_lock), to_lock);
        size_t codes = out.size() / table_->code_width();
        log_success("convert", codes, codes);
        return out;
    } catch (const CodecError& e) {
        log_failure("convert", e);
        throw;
    }
}

void SingleCodec::log_success(const char* op, size_t chars, size_t codes) const {
    log_codec_event(*sink_, LogLevel::Debug, op, true, chars, codes);
}

void SingleCodec::log_failure(const char* op, const CodecError& error) const {
    log_codec_event(*sink_, LogLevel::Warn, op, false, 0, 0, error.what());
}

} // namespace vsnsl
