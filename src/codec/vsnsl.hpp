#pragma once

#include "single_codec.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace vsnsl {

// Library entry point. Owns a reference to the current charset table and an
// optional default lock. Each call takes one snapshot of the table, so a
// concurrent reload_charset() never mixes old and new mappings mid-call.
class Vsnsl {
public:
    explicit Vsnsl(std::shared_ptr<const CharsetTable> table,
                   std::optional<Lock> default_lock = std::nullopt,
                   LogSink* sink = nullptr);

    // Single string, default lock (throws MissingLockError without one)
    std::string encode_data(std::string_view text) const;
    std::string decode_data(std::string_view encoded) const;

    std::string encode_data(std::string_view text, Lock lock) const;
    std::string decode_data(std::string_view encoded, Lock lock) const;

    // From the default lock to new_lock
    std::string convert_data(std::string_view encoded, Lock new_lock) const;
    std::string convert_data(std::string_view encoded, Lock from_lock, Lock to_lock) const;

    std::vector<std::string> encode_batch(const std::vector<std::string>& texts) const;
    std::vector<std::string> decode_batch(const std::vector<std::string>& encoded) const;
    std::vector<std::string> encode_batch(const std::vector<std::string>& texts, Lock lock) const;
    std::vector<std::string> decode_batch(const std::vector<std::string>& encoded, Lock lock) const;

    std::string multi_encode(const std::vector<Lock>& locks, std::string_view text) const;
    std::string multi_decode(const std::vector<Lock>& locks, std::string_view encoded) const;

    void reload_charset(std::shared_ptr<const CharsetTable> table);
    std::shared_ptr<const CharsetTable> charset() const;

    std::optional<Lock> default_lock() const { return default_lock_; }

    struct Stats {
        std::atomic<uint64_t> operations{0};
        std::atomic<uint64_t> failures{0};
        std::atomic<uint64_t> chars_encoded{0};
        std::atomic<uint64_t> codes_decoded{0};
    };

    const Stats& get_stats() const { return stats_; }

private:
    Lock require_default_lock() const;
    SingleCodec snapshot() const;

    template <typename Fn>
    auto track(Fn&& fn) const -> decltype(fn());

    mutable std::shared_mutex mutex_;
    std::shared_ptr<const CharsetTable> table_;
    std::optional<Lock> default_lock_;
    LogSink* sink_;

    mutable Stats stats_;
};

} // namespace vsnsl
