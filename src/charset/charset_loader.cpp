#include "charset_loader.hpp"
#include "../common/errors.hpp"
#include "../common/utf8.hpp"
#include <algorithm>
#include <fstream>
#include <limits>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace vsnsl {

namespace {

char32_t parse_key(const std::string& key, const std::string& source) {
    auto cps = utf8::decode(key);
    if (cps.size() != 1) {
        throw CharsetFormatError(source + ": key '" + key + "' is not a single character");
    }
    if (cps[0] == utf8::REPLACEMENT_CHAR && key != utf8::encode(utf8::REPLACEMENT_CHAR)) {
        throw CharsetFormatError(source + ": key is not valid UTF-8");
    }
    return cps[0];
}

} // namespace

CharsetLoader::CharsetLoader(uint32_t code_offset) : code_offset_(code_offset) {
}

CharsetLoader& CharsetLoader::load_json(const nlohmann::json& doc, const std::string& source) {
    if (!doc.is_object()) {
        throw CharsetFormatError(source + ": document must be an object");
    }

    auto mapping_it = doc.find("mapping");
    if (mapping_it == doc.end() || !mapping_it->is_object() || mapping_it->empty()) {
        throw CharsetFormatError(source + ": mapping must be provided");
    }

    // Validate everything before touching the builder
    std::vector<std::pair<char32_t, Code>> staged;
    staged.reserve(mapping_it->size());

    for (const auto& [key, value] : mapping_it->items()) {
        char32_t ch = parse_key(key, source);

        if (!value.is_number_integer()) {
            throw CharsetFormatError(source + ": value for '" + key + "' is not an integer");
        }
        auto raw = value.get<int64_t>();
        if (raw < 0) {
            throw CharsetFormatError(source + ": value for '" + key + "' is negative");
        }
        auto shifted = static_cast<uint64_t>(raw) + code_offset_;
        if (shifted > std::numeric_limits<Code>::max()) {
            throw CharsetFormatError(source + ": value for '" + key + "' is too large");
        }
        staged.emplace_back(ch, static_cast<Code>(shifted));
    }

    CharsetInfo info = builder_.info();
    try {
        if (doc.contains("author")) info.author = doc["author"].get<std::string>();
        if (doc.contains("timestamp")) info.timestamp = doc["timestamp"].get<double>();
    } catch (const nlohmann::json::exception& e) {
        throw CharsetFormatError(source + ": " + e.what());
    }

    for (const auto& [ch, code] : staged) {
        builder_.set(ch, code);
    }
    builder_.set_info(std::move(info));
    ++documents_loaded_;

    spdlog::debug("Loaded {} charset entries from {}", staged.size(), source);
    return *this;
}

CharsetLoader& CharsetLoader::load_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw CharsetFormatError("cannot open " + path.string());
    }

    nlohmann::json doc;
    try {
        file >> doc;
    } catch (const nlohmann::json::parse_error& e) {
        throw CharsetFormatError(path.filename().string() + ": " + e.what());
    }

    return load_json(doc, path.filename().string());
}

CharsetLoader& CharsetLoader::load_directory(const std::filesystem::path& dir) {
    std::error_code ec;
    std::vector<std::filesystem::path> files;

    std::filesystem::recursive_directory_iterator it(dir, ec);
    const std::filesystem::recursive_directory_iterator end;
    while (!ec && it != end) {
        // Dangling links and the like are not charset files
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec) && it->path().extension() == ".json") {
            files.push_back(it->path());
        }
        it.increment(ec);
    }
    if (ec) {
        throw CharsetFormatError("cannot read directory " + dir.string() + ": " + ec.message());
    }
    if (files.empty()) {
        throw CharsetFormatError("no charset files found in " + dir.string());
    }

    std::sort(files.begin(), files.end());
    for (const auto& path : files) {
        load_file(path);
    }

    spdlog::info("Loaded {} charset files from {}", files.size(), dir.string());
    return *this;
}

CharsetLoader& CharsetLoader::load_path(const std::filesystem::path& path) {
    std::error_code ec;
    bool is_dir = std::filesystem::is_directory(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        throw CharsetFormatError("cannot stat " + path.string() + ": " + ec.message());
    }
    if (is_dir) {
        return load_directory(path);
    }
    return load_file(path);
}

std::shared_ptr<const CharsetTable> CharsetLoader::build(size_t code_width) const {
    return builder_.build(code_width);
}

std::shared_ptr<const CharsetTable> load_charset(const CharsetConfig& config) {
    CharsetLoader loader(config.code_offset);
    loader.load_path(config.path);
    return loader.build(config.code_width);
}

} // namespace vsnsl
