#include "cli/commands.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/spdlog_sink.hpp"
#include "charset/charset_loader.hpp"
#include "codec/vsnsl.hpp"

#include <spdlog/spdlog.h>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    std::string config_path = "vsnsl.json";
    std::vector<std::string> args(argv + 1, argv + argc);

    if (args.size() >= 2 && args[0] == "--config") {
        config_path = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }
    if (args.empty()) {
        vsnsl::cli::print_usage(std::cerr, argv[0]);
        return vsnsl::cli::EXIT_USAGE;
    }

    try {
        vsnsl::Config config = vsnsl::Config::load_from_file(config_path);

        auto logger = vsnsl::make_logger("vsnsl", config.logging);
        spdlog::set_default_logger(logger);
        vsnsl::SpdlogSink sink(logger);

        spdlog::debug("Loaded configuration from {}", config_path);

        auto table = vsnsl::load_charset(config.charset);
        spdlog::info("Charset ready: {} entries, code width {}", table->size(), table->code_width());

        vsnsl::Vsnsl codec(table, config.codec.default_lock, &sink);
        return vsnsl::cli::dispatch(codec, args, std::cout, std::cerr, argv[0]);

    } catch (const vsnsl::CodecError& e) {
        spdlog::error("{} error ({}): {}", vsnsl::to_string(e.category()),
                      vsnsl::to_string(e.code()), e.what());
        return vsnsl::cli::EXIT_CODEC_ERROR;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return vsnsl::cli::EXIT_CODEC_ERROR;
    }
}
