#include "commands.hpp"
#include "../common/errors.hpp"
#include <charconv>
#include <spdlog/spdlog.h>

namespace vsnsl::cli {

namespace {

void require_args(const std::vector<std::string>& args, size_t count) {
    if (args.size() < count) {
        throw UsageError("missing arguments");
    }
}

} // namespace

void print_usage(std::ostream& out, const std::string& program) {
    out << "Usage: " << program << " [--config <file>] <command> [args...]\n"
        << "Commands:\n"
        << "  encode <lock> <text>\n"
        << "  decode <lock> <data>\n"
        << "  convert <from-lock> <to-lock> <data>\n"
        << "  batch-encode <lock> <text>...\n"
        << "  batch-decode <lock> <data>...\n"
        << "  mencode <lock,lock,...> <text>\n"
        << "  mdecode <lock,lock,...> <data>\n"
        << "  charset\n";
}

Lock parse_lock(const std::string& arg) {
    Lock value = 0;
    const char* first = arg.data();
    const char* last = arg.data() + arg.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (arg.empty() || ec != std::errc() || ptr != last) {
        throw UsageError("invalid lock '" + arg + "'");
    }
    return value;
}

std::vector<Lock> parse_locks(const std::string& arg) {
    std::vector<Lock> locks;
    size_t start = 0;
    while (start <= arg.size()) {
        size_t comma = arg.find(',', start);
        if (comma == std::string::npos) comma = arg.size();
        locks.push_back(parse_lock(arg.substr(start, comma - start)));
        start = comma + 1;
    }
    return locks;
}

void run_command(const Vsnsl& codec, const std::string& command,
                 const std::vector<std::string>& args, std::ostream& out) {
    if (command == "encode") {
        require_args(args, 2);
        out << codec.encode_data(args[1], parse_lock(args[0])) << "\n";
    } else if (command == "decode") {
        require_args(args, 2);
        out << codec.decode_data(args[1], parse_lock(args[0])) << "\n";
    } else if (command == "convert") {
        require_args(args, 3);
        out << codec.convert_data(args[2], parse_lock(args[0]), parse_lock(args[1])) << "\n";
    } else if (command == "batch-encode" || command == "batch-decode") {
        require_args(args, 1);
        std::vector<std::string> items(args.begin() + 1, args.end());
        auto lock = parse_lock(args[0]);
        auto results = command == "batch-encode" ? codec.encode_batch(items, lock)
                                                 : codec.decode_batch(items, lock);
        for (const auto& r : results) {
            out << r << "\n";
        }
    } else if (command == "mencode") {
        require_args(args, 2);
        out << codec.multi_encode(parse_locks(args[0]), args[1]) << "\n";
    } else if (command == "mdecode") {
        require_args(args, 2);
        out << codec.multi_decode(parse_locks(args[0]), args[1]) << "\n";
    } else if (command == "charset") {
        auto table = codec.charset();
        if (!table) {
            throw TableNotInitializedError();
        }
        out << "Author: " << table->info().author << "\n"
            << "Code width: " << table->code_width() << "\n";
        for (const auto& [code, ch] : table->entries()) {
            out << "  " << describe_char(ch) << ": " << code << "\n";
        }
    } else {
        throw UsageError("unknown command '" + command + "'");
    }
}

int dispatch(const Vsnsl& codec, const std::vector<std::string>& args,
             std::ostream& out, std::ostream& err, const std::string& program) {
    if (args.empty()) {
        print_usage(err, program);
        return EXIT_USAGE;
    }

    std::vector<std::string> rest(args.begin() + 1, args.end());
    try {
        run_command(codec, args[0], rest, out);
        return EXIT_OK;
    } catch (const UsageError& e) {
        err << "Error: " << e.what() << "\n";
        print_usage(err, program);
        return EXIT_USAGE;
    } catch (const CodecError& e) {
        spdlog::error("{} error ({}): {}", to_string(e.category()), to_string(e.code()), e.what());
        return EXIT_CODEC_ERROR;
    }
}

} // namespace vsnsl::cli
