#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

namespace vsnsl {

enum class ErrorCode : uint8_t {
    UnknownCharacter,
    UnknownCode,
    MalformedLength,
    MalformedDigits,
    EmptyLockSequence,
    TableNotInitialized,
    LockOverflow,
    MissingLock,
    InvalidTable,
    CharsetFormat,
    Config
};

// Configuration = table/config problems, InputFormat = bad encoded data,
// Usage = caller passed arguments the API cannot act on.
enum class ErrorCategory : uint8_t { Configuration, InputFormat, Usage };

const char* to_string(ErrorCode code);
const char* to_string(ErrorCategory category);
ErrorCategory category_of(ErrorCode code);

class CodecError : public std::runtime_error {
public:
    CodecError(ErrorCode code, const std::string& message);

    ErrorCode code() const noexcept { return code_; }
    ErrorCategory category() const noexcept { return category_of(code_); }

private:
    ErrorCode code_;
};

class UnknownCharacterError : public CodecError {
public:
    explicit UnknownCharacterError(char32_t ch);
    char32_t character() const noexcept { return ch_; }

private:
    char32_t ch_;
};

class UnknownCodeError : public CodecError {
public:
    explicit UnknownCodeError(int64_t code);
    // The lock is so negative that no group could decode; value() is the raw group.
    UnknownCodeError(int64_t group_value, int64_t lock);

    int64_t value() const noexcept { return value_; }
    const std::optional<int64_t>& lock() const noexcept { return lock_; }

private:
    int64_t value_;
    std::optional<int64_t> lock_;
};

class MalformedLengthError : public CodecError {
public:
    MalformedLengthError(size_t length, size_t code_width);
};

class MalformedDigitsError : public CodecError {
public:
    MalformedDigitsError(const std::string& group, size_t offset);
    size_t offset() const noexcept { return offset_; }

private:
    size_t offset_;
};

class EmptyLockSequenceError : public CodecError {
public:
    EmptyLockSequenceError();
};

class TableNotInitializedError : public CodecError {
public:
    TableNotInitializedError();
};

class LockOverflowError : public CodecError {
public:
    LockOverflowError(char32_t ch, uint32_t code, int64_t lock, size_t code_width);
};

class MissingLockError : public CodecError {
public:
    MissingLockError();
};

class InvalidTableError : public CodecError {
public:
    explicit InvalidTableError(const std::string& reason);
};

class CharsetFormatError : public CodecError {
public:
    explicit CharsetFormatError(const std::string& reason);
};

class ConfigError : public CodecError {
public:
    explicit ConfigError(const std::string& reason);
};

// Raised by the batch codec: wraps the first failing element's error.
class BatchItemError : public CodecError {
public:
    BatchItemError(size_t index, const CodecError& cause, std::exception_ptr cause_ptr);

    size_t index() const noexcept { return index_; }
    ErrorCode cause_code() const noexcept { return cause_code_; }
    ErrorCategory cause_category() const noexcept { return category_of(cause_code_); }
    [[noreturn]] void rethrow_cause() const;

private:
    size_t index_;
    ErrorCode cause_code_;
    std::exception_ptr cause_;
};

// "U+0041 'A'" style rendering for messages.
std::string describe_char(char32_t ch);

} // namespace vsnsl
