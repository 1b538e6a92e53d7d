#pragma once

#include "single_codec.hpp"
#include <string>
#include <vector>

namespace vsnsl {

// Element-wise single codec over an ordered batch. Fail-fast: the first
// failing element aborts the batch with BatchItemError (carrying its index),
// and no results are returned.
class BatchCodec {
public:
    explicit BatchCodec(const SingleCodec& codec) : codec_(codec) {}

    std::vector<std::string> encode_batch(const std::vector<std::string>& texts, Lock lock) const;
    std::vector<std::string> decode_batch(const std::vector<std::string>& encoded, Lock lock) const;

private:
    template <typename Fn>
    std::vector<std::string> run(const char* op, const std::vector<std::string>& items,
                                 bool items_encoded, Fn&& fn) const;

    const SingleCodec& codec_;
};

} // namespace vsnsl
