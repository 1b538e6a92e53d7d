#pragma once

#include "../codec/vsnsl.hpp"
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace vsnsl::cli {

constexpr int EXIT_OK = 0;
constexpr int EXIT_CODEC_ERROR = 1;
constexpr int EXIT_USAGE = 2;

struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

void print_usage(std::ostream& out, const std::string& program);

// Whole-string signed decimal; anything else is a UsageError.
Lock parse_lock(const std::string& arg);

// "1,2,3" -> {1, 2, 3}. Empty entries are rejected.
std::vector<Lock> parse_locks(const std::string& arg);

// Runs one command and writes its results to out, one per line.
// Throws UsageError for bad arguments and CodecError from the codec.
void run_command(const Vsnsl& codec, const std::string& command,
                 const std::vector<std::string>& args, std::ostream& out);

// args[0] is the command. A UsageError goes to err with the usage text and
// yields EXIT_USAGE; a CodecError is logged and yields EXIT_CODEC_ERROR.
int dispatch(const Vsnsl& codec, const std::vector<std::string>& args,
             std::ostream& out, std::ostream& err, const std::string& program = "vsnsl_cli");

} // namespace vsnsl::cli
