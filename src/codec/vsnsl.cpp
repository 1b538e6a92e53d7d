#include "vsnsl.hpp"
#include "batch_codec.hpp"
#include "multi_lock_codec.hpp"
#include "../common/errors.hpp"
#include <mutex>
#include <fmt/format.h>

namespace vsnsl {

namespace {

size_t group_count(std::string_view encoded, const SingleCodec& codec) {
    return encoded.size() / codec.table().code_width();
}

size_t group_count(const std::vector<std::string>& encoded, const SingleCodec& codec) {
    size_t total = 0;
    for (const auto& item : encoded) {
        total += group_count(item, codec);
    }
    return total;
}

} // namespace

Vsnsl::Vsnsl(std::shared_ptr<const CharsetTable> table,
             std::optional<Lock> default_lock,
             LogSink* sink)
    : table_(std::move(table)), default_lock_(default_lock),
      sink_(sink ? sink : &NullLogSink::instance()) {
    if (sink_->enabled(LogLevel::Info)) {
        sink_->log(LogLevel::Info,
                   fmt::format("Initializing codec (table={}, default_lock={})",
                               table_ ? fmt::format("{} entries", table_->size()) : "none",
                               default_lock_ ? std::to_string(*default_lock_) : "none"));
    }
}

Lock Vsnsl::require_default_lock() const {
    if (!default_lock_) {
        stats_.operations.fetch_add(1);
        stats_.failures.fetch_add(1);
        throw MissingLockError();
    }
    return *default_lock_;
}

SingleCodec Vsnsl::snapshot() const {
    std::shared_lock lock(mutex_);
    return SingleCodec(table_, sink_);
}

template <typename Fn>
auto Vsnsl::track(Fn&& fn) const -> decltype(fn()) {
    stats_.operations.fetch_add(1);
    try {
        return fn();
    } catch (const CodecError&) {
        stats_.failures.fetch_add(1);
        throw;
    }
}

std::string Vsnsl::encode_data(std::string_view text) const {
    return encode_data(text, require_default_lock());
}

std::string Vsnsl::decode_data(std::string_view encoded) const {
    return decode_data(encoded, require_default_lock());
}

std::string Vsnsl::encode_data(std::string_view text, Lock lock) const {
    return track([&] {
        auto codec = snapshot();
        std::string out = codec.encode_data(text, lock);
        stats_.chars_encoded.fetch_add(group_count(out, codec));
        return out;
    });
}

std::string Vsnsl::decode_data(std::string_view encoded, Lock lock) const {
    return track([&] {
        auto codec = snapshot();
        std::string out = codec.decode_data(encoded, lock);
        stats_.codes_decoded.fetch_add(group_count(encoded, codec));
        return out;
    });
}

std::string Vsnsl::convert_data(std::string_view encoded, Lock new_lock) const {
    return convert_data(encoded, require_default_lock(), new_lock);
}

std::string Vsnsl::convert_data(std::string_view encoded, Lock from_lock, Lock to_lock) const {
    return track([&] {
        auto codec = snapshot();
        return codec.convert_data(encoded, from_lock, to_lock);
    });
}

std::vector<std::string> Vsnsl::encode_batch(const std::vector<std::string>& texts) const {
    return encode_batch(texts, require_default_lock());
}

std::vector<std::string> Vsnsl::decode_batch(const std::vector<std::string>& encoded) const {
    return decode_batch(encoded, require_default_lock());
}

std::vector<std::string> Vsnsl::encode_batch(const std::vector<std::string>& texts,
                                             Lock lock) const {
    return track([&] {
        auto codec = snapshot();
        auto out = BatchCodec(codec).encode_batch(texts, lock);
        stats_.chars_encoded.fetch_add(group_count(out, codec));
        return out;
    });
}

std::vector<std::string> Vsnsl::decode_batch(const std::vector<std::string>& encoded,
                                             Lock lock) const {
    return track([&] {
        auto codec = snapshot();
        auto out = BatchCodec(codec).decode_batch(encoded, lock);
        stats_.codes_decoded.fetch_add(group_count(encoded, codec));
        return out;
    });
}

std::string Vsnsl::multi_encode(const std::vector<Lock>& locks, std::string_view text) const {
    return track([&] {
        auto codec = snapshot();
        std::string out = MultiLockCodec(codec).multi_encode(locks, text);
        stats_.chars_encoded.fetch_add(group_count(out, codec));
        return out;
    });
}

std::string Vsnsl::multi_decode(const std::vector<Lock>& locks, std::string_view encoded) const {
    return track([&] {
        auto codec = snapshot();
        std::string out = MultiLockCodec(codec).multi_decode(locks, encoded);
        stats_.codes_decoded.fetch_add(group_count(encoded, codec));
        return out;
    });
}

void Vsnsl::reload_charset(std::shared_ptr<const CharsetTable> table) {
    size_t entries = table ? table->size() : 0;
    {
        std::unique_lock lock(mutex_);
        table_ = std::move(table);
    }
    if (sink_->enabled(LogLevel::Info)) {
        sink_->log(LogLevel::Info, fmt::format("Charset reloaded ({} entries)", entries));
    }
}

std::shared_ptr<const CharsetTable> Vsnsl::charset() const {
    std::shared_lock lock(mutex_);
    return table_;
}

} // namespace vsnsl
