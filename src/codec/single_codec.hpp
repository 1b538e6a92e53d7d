#pragma once

#include "../charset/charset_table.hpp"
#include "../common/log_sink.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace vsnsl {

using Lock = int64_t;

class CodecError;

// Encodes text as fixed-width decimal groups, one per code point:
// group = code(ch) + lock, zero-padded to the table's code width.
// Locked codes outside [0, 10^code_width) are rejected with LockOverflowError.
// Every operation either returns the full result or throws; there is no
// partial output.
class SingleCodec {
public:
    // A null table is allowed; every operation then throws TableNotInitializedError.
    explicit SingleCodec(std::shared_ptr<const CharsetTable> table, LogSink* sink = nullptr);

    std::string encode_data(std::string_view text, Lock lock) const;
    std::string decode_data(std::string_view encoded, Lock lock) const;

    // Re-lock already encoded text: decode under from_lock, encode under to_lock.
    std::string convert_data(std::string_view encoded, Lock from_lock, Lock to_lock) const;

    bool has_table() const noexcept { return table_ != nullptr; }
    const CharsetTable& table() const;
    const std::shared_ptr<const CharsetTable>& table_ptr() const noexcept { return table_; }
    LogSink& sink() const noexcept { return *sink_; }

    // Unlogged variants, used by the layered codecs.
    std::string encode_raw(std::string_view text, Lock lock) const;
    std::string decode_raw(std::string_view encoded, Lock lock) const;

private:
    void log_success(const char* op, size_t chars, size_t codes) const;
    void log_failure(const char* op, const CodecError& error) const;

    std::shared_ptr<const CharsetTable> table_;
    LogSink* sink_;
};

// Shared by the batch and multi-lock codecs for their own events.
void log_codec_event(LogSink& sink, LogLevel level, const char* op, bool ok,
                     size_t chars, size_t codes, std::string_view detail = {});

} // namespace vsnsl
