#include "errors.hpp"
#include "utf8.hpp"
#include <fmt/format.h>

namespace vsnsl {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::UnknownCharacter:    return "UnknownCharacter";
        case ErrorCode::UnknownCode:         return "UnknownCode";
        case ErrorCode::MalformedLength:     return "MalformedLength";
        case ErrorCode::MalformedDigits:     return "MalformedDigits";
        case ErrorCode::EmptyLockSequence:   return "EmptyLockSequence";
        case ErrorCode::TableNotInitialized: return "TableNotInitialized";
        case ErrorCode::LockOverflow:        return "LockOverflow";
        case ErrorCode::MissingLock:         return "MissingLock";
        case ErrorCode::InvalidTable:        return "InvalidTable";
        case ErrorCode::CharsetFormat:       return "CharsetFormat";
        case ErrorCode::Config:              return "Config";
    }
    return "Unknown";
}

const char* to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Configuration: return "configuration";
        case ErrorCategory::InputFormat:   return "input-format";
        case ErrorCategory::Usage:         return "usage";
    }
    return "unknown";
}

ErrorCategory category_of(ErrorCode code) {
    switch (code) {
        case ErrorCode::MalformedLength:
        case ErrorCode::MalformedDigits:
        case ErrorCode::UnknownCode:
            return ErrorCategory::InputFormat;
        case ErrorCode::EmptyLockSequence:
        case ErrorCode::MissingLock:
        case ErrorCode::LockOverflow:
            return ErrorCategory::Usage;
        default:
            return ErrorCategory::Configuration;
    }
}

std::string describe_char(char32_t ch) {
    auto cp = static_cast<uint32_t>(ch);
    if (cp >= 0x20 && cp != 0x7F && cp != utf8::REPLACEMENT_CHAR) {
        return fmt::format("U+{:04X} '{}'", cp, utf8::encode(ch));
    }
    return fmt::format("U+{:04X}", cp);
}

CodecError::CodecError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {
}

UnknownCharacterError::UnknownCharacterError(char32_t ch)
    : CodecError(ErrorCode::UnknownCharacter,
                 fmt::format("Character {} not found in charset", describe_char(ch))),
      ch_(ch) {
}

UnknownCodeError::UnknownCodeError(int64_t code)
    : CodecError(ErrorCode::UnknownCode,
                 fmt::format("Code {} has no character in charset", code)),
      value_(code) {
}

UnknownCodeError::UnknownCodeError(int64_t group_value, int64_t lock)
    : CodecError(ErrorCode::UnknownCode,
                 fmt::format("Group {} cannot decode under lock {}: lock is below -10^width",
                             group_value, lock)),
      value_(group_value), lock_(lock) {
}

MalformedLengthError::MalformedLengthError(size_t length, size_t code_width)
    : CodecError(ErrorCode::MalformedLength,
                 fmt::format("Encoded length {} is not a multiple of code width {}",
                             length, code_width)) {
}

MalformedDigitsError::MalformedDigitsError(const std::string& group, size_t offset)
    : CodecError(ErrorCode::MalformedDigits,
                 fmt::format("Group '{}' at offset {} contains non-digit characters",
                             group, offset)),
      offset_(offset) {
}

EmptyLockSequenceError::EmptyLockSequenceError()
    : CodecError(ErrorCode::EmptyLockSequence, "Lock sequence must not be empty") {
}

TableNotInitializedError::TableNotInitializedError()
    : CodecError(ErrorCode::TableNotInitialized, "Charset table has not been loaded") {
}

LockOverflowError::LockOverflowError(char32_t ch, uint32_t code, int64_t lock, size_t code_width)
    : CodecError(ErrorCode::LockOverflow,
                 fmt::format("Code {} of {} with lock {} does not fit in {} digits",
                             code, describe_char(ch), lock, code_width)) {
}

MissingLockError::MissingLockError()
    : CodecError(ErrorCode::MissingLock, "No lock given and codec has no default lock") {
}

InvalidTableError::InvalidTableError(const std::string& reason)
    : CodecError(ErrorCode::InvalidTable, "Invalid charset table: " + reason) {
}

CharsetFormatError::CharsetFormatError(const std::string& reason)
    : CodecError(ErrorCode::CharsetFormat, "Charset format error: " + reason) {
}

ConfigError::ConfigError(const std::string& reason)
    : CodecError(ErrorCode::Config, "Configuration error: " + reason) {
}

BatchItemError::BatchItemError(size_t index, const CodecError& cause, std::exception_ptr cause_ptr)
    : CodecError(cause.code(), fmt::format("Batch item {} failed: {}", index, cause.what())),
      index_(index), cause_code_(cause.code()), cause_(std::move(cause_ptr)) {
}

void BatchItemError::rethrow_cause() const {
    std::rethrow_exception(cause_);
}

} // namespace vsnsl
