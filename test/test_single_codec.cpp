#include <gtest/gtest.h>
#include "codec/single_codec.hpp"
#include "common/errors.hpp"
#include "test_support.hpp"
#include <limits>

using namespace vsnsl;

class SingleCodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        codec_ = std::make_unique<SingleCodec>(test::letters_and_digits(), &sink_);
    }

    test::RecordingSink sink_;
    std::unique_ptr<SingleCodec> codec_;
};

TEST_F(SingleCodecTest, EncodesConcreteScenario) {
    EXPECT_EQ(codec_->encode_data("abc", 1), "101102103");
}

TEST_F(SingleCodecTest, DecodesConcreteScenario) {
    EXPECT_EQ(codec_->decode_data("101102103", 1), "abc");
}

TEST_F(SingleCodecTest, EmptyInputIsIdentity) {
    for (Lock lock : {-5, 0, 1, 42}) {
        EXPECT_EQ(codec_->encode_data("", lock), "");
        EXPECT_EQ(codec_->decode_data("", lock), "");
    }
}

TEST_F(SingleCodecTest, ZeroLockEncodesRawCodes) {
    EXPECT_EQ(codec_->encode_data("az09", 0), "100125126135");
}

TEST_F(SingleCodecTest, RoundTripAcrossLocks) {
    const std::string text = "thequickbrownfox0123456789";
    for (Lock lock : {-100, -1, 0, 1, 7, 300, 864}) {
        auto encoded = codec_->encode_data(text, lock);
        EXPECT_EQ(encoded.size(), text.size() * 3) << "lock " << lock;
        EXPECT_EQ(codec_->decode_data(encoded, lock), text) << "lock " << lock;
    }
}

TEST_F(SingleCodecTest, WrongLockDoesNotRecoverText) {
    auto encoded = codec_->encode_data("hello", 5);
    EXPECT_NE(codec_->decode_data(encoded, 4), "hello");
}

TEST_F(SingleCodecTest, UnknownCharacterFailsWholeCall) {
    try {
        codec_->encode_data("abc!", 1);
        FAIL() << "expected UnknownCharacterError";
    } catch (const UnknownCharacterError& e) {
        EXPECT_EQ(e.character(), U'!');
        EXPECT_NE(std::string(e.what()).find("'!'"), std::string::npos);
    }
}

TEST_F(SingleCodecTest, LockOverflowAboveWidthIsRejected) {
    // '9' -> 135, 135 + 864 = 999 fits; 865 does not
    EXPECT_EQ(codec_->encode_data("9", 864), "999");
    EXPECT_THROW(codec_->encode_data("9", 865), LockOverflowError);
}

TEST_F(SingleCodecTest, NegativeLockBelowZeroIsRejected) {
    EXPECT_EQ(codec_->encode_data("a", -100), "000");
    EXPECT_THROW(codec_->encode_data("a", -101), LockOverflowError);
}

TEST_F(SingleCodecTest, HugeLocksAreRejectedWithoutArithmeticOverflow) {
    EXPECT_THROW(codec_->encode_data("a", std::numeric_limits<Lock>::max()), LockOverflowError);
    EXPECT_THROW(codec_->encode_data("a", std::numeric_limits<Lock>::min()), LockOverflowError);
    EXPECT_THROW(codec_->decode_data("101", std::numeric_limits<Lock>::max()), UnknownCodeError);
    EXPECT_THROW(codec_->decode_data("101", std::numeric_limits<Lock>::min()), UnknownCodeError);
}

TEST_F(SingleCodecTest, VeryNegativeLockReportsGroupAndLock) {
    try {
        codec_->decode_data("101", -1000);
        FAIL() << "expected UnknownCodeError";
    } catch (const UnknownCodeError& e) {
        EXPECT_EQ(e.value(), 101);
        ASSERT_TRUE(e.lock().has_value());
        EXPECT_EQ(*e.lock(), -1000);
        EXPECT_NE(std::string(e.what()).find("lock -1000"), std::string::npos);
    }

    try {
        codec_->decode_data("101999", 0);
        FAIL() << "expected UnknownCodeError";
    } catch (const UnknownCodeError& e) {
        EXPECT_FALSE(e.lock().has_value());
    }
}

TEST_F(SingleCodecTest, OverflowIsCategorizedAsUsage) {
    try {
        codec_->encode_data("z", 900);
        FAIL() << "expected LockOverflowError";
    } catch (const CodecError& e) {
        EXPECT_EQ(e.code(), ErrorCode::LockOverflow);
        EXPECT_EQ(e.category(), ErrorCategory::Usage);
    }
}

TEST_F(SingleCodecTest, MalformedLengthIsRejected) {
    try {
        codec_->decode_data("1011", 1);
        FAIL() << "expected MalformedLengthError";
    } catch (const MalformedLengthError& e) {
        EXPECT_EQ(e.category(), ErrorCategory::InputFormat);
    }
    EXPECT_THROW(codec_->decode_data("10", 0), MalformedLengthError);
}

TEST_F(SingleCodecTest, NonDigitGroupsAreRejected) {
    EXPECT_THROW(codec_->decode_data("10a", 0), MalformedDigitsError);
    EXPECT_THROW(codec_->decode_data("-01", 0), MalformedDigitsError);
    EXPECT_THROW(codec_->decode_data("+01", 0), MalformedDigitsError);
    EXPECT_THROW(codec_->decode_data("101 02", 0), MalformedDigitsError);

    try {
        codec_->decode_data("10110x", 1);
        FAIL() << "expected MalformedDigitsError";
    } catch (const MalformedDigitsError& e) {
        EXPECT_EQ(e.offset(), 3u);
    }
}

TEST_F(SingleCodecTest, UnmappedCodesAreRejected) {
    EXPECT_THROW(codec_->decode_data("999", 0), UnknownCodeError);
    EXPECT_THROW(codec_->decode_data("005", 10), UnknownCodeError);
    try {
        codec_->decode_data("101999", 0);
        FAIL() << "expected UnknownCodeError";
    } catch (const UnknownCodeError& e) {
        EXPECT_EQ(e.value(), 999);
    }
}

TEST_F(SingleCodecTest, ConvertDataRelocks) {
    EXPECT_EQ(codec_->convert_data("101102103", 1, 2), "102103104");
    EXPECT_EQ(codec_->decode_data(codec_->convert_data("101102103", 1, 50), 50), "abc");
}

TEST_F(SingleCodecTest, MissingTableFailsEveryCall) {
    SingleCodec empty(nullptr);
    EXPECT_FALSE(empty.has_table());
    EXPECT_THROW(empty.encode_data("a", 1), TableNotInitializedError);
    EXPECT_THROW(empty.decode_data("101", 1), TableNotInitializedError);
    EXPECT_THROW(empty.encode_data("", 1), TableNotInitializedError);
    EXPECT_THROW(empty.convert_data("101", 1, 2), TableNotInitializedError);
}

TEST_F(SingleCodecTest, MultiByteCharacters) {
    auto table = std::make_shared<const CharsetTable>(
        std::unordered_map<char32_t, Code>{{U'é', 200}, {U'ß', 201}, {U'😀', 202}});
    SingleCodec codec(table);

    auto encoded = codec.encode_data("éß😀", 3);
    EXPECT_EQ(encoded, "203204205");
    EXPECT_EQ(codec.decode_data(encoded, 3), "éß😀");
}

TEST_F(SingleCodecTest, InvalidUtf8SurfacesAsReplacementCharacter) {
    try {
        codec_->encode_data(std::string("a\xff"), 1);
        FAIL() << "expected UnknownCharacterError";
    } catch (const UnknownCharacterError& e) {
        EXPECT_EQ(e.character(), char32_t{0xFFFD});
    }
}

TEST_F(SingleCodecTest, LogsSuccessWithCounts) {
    codec_->encode_data("abc", 1);
    EXPECT_TRUE(sink_.contains(LogLevel::Debug, "op=encode status=ok chars=3 codes=3"));

    codec_->decode_data("101102", 1);
    EXPECT_TRUE(sink_.contains(LogLevel::Debug, "op=decode status=ok chars=2 codes=2"));
}

TEST_F(SingleCodecTest, LogsFailure) {
    EXPECT_THROW(codec_->decode_data("1011", 1), MalformedLengthError);
    EXPECT_TRUE(sink_.contains(LogLevel::Warn, "op=decode status=error"));
}
