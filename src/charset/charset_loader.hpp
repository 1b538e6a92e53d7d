#pragma once

#include "charset_builder.hpp"
#include "../common/config.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace vsnsl {

// Reads charset documents of the form
//   {"author": "...", "timestamp": 0, "mapping": {"a": 0, "b": 1, ...}}
// and shifts every mapped value by code_offset. Later documents override
// keys loaded by earlier ones. All failures throw CharsetFormatError.
class CharsetLoader {
public:
    static constexpr uint32_t DEFAULT_CODE_OFFSET = 100;

    explicit CharsetLoader(uint32_t code_offset = DEFAULT_CODE_OFFSET);

    CharsetLoader& load_json(const nlohmann::json& doc, const std::string& source = "<json>");
    CharsetLoader& load_file(const std::filesystem::path& path);
    CharsetLoader& load_directory(const std::filesystem::path& dir);
    CharsetLoader& load_path(const std::filesystem::path& path);

    const CharsetBuilder& builder() const { return builder_; }
    size_t documents_loaded() const { return documents_loaded_; }

    std::shared_ptr<const CharsetTable> build(size_t code_width = 0) const;

private:
    uint32_t code_offset_;
    CharsetBuilder builder_;
    size_t documents_loaded_ = 0;
};

std::shared_ptr<const CharsetTable> load_charset(const CharsetConfig& config);

} // namespace vsnsl
