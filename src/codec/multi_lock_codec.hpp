#pragma once

#include "single_codec.hpp"
#include <string>
#include <vector>

namespace vsnsl {

// Layers the single codec once per lock: forward order on encode, reverse
// order on decode. Every layer after the first re-encodes a digit string,
// so sequences longer than one require the table to map '0'-'9'; that is
// checked before any layer runs.
class MultiLockCodec {
public:
    explicit MultiLockCodec(const SingleCodec& codec) : codec_(codec) {}

    std::string multi_encode(const std::vector<Lock>& locks, std::string_view text) const;
    std::string multi_decode(const std::vector<Lock>& locks, std::string_view encoded) const;

private:
    void check_locks(const std::vector<Lock>& locks) const;

    const SingleCodec& codec_;
};

} // namespace vsnsl
