#include "obfuscator/format/loader.hpp"
#include "obfuscator/core/logger.hpp"
#include "obfuscator/core/utils.hpp"
#include "obfuscator/format/yaml_codec.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace obfuscator::format {

auto parse_json(std::string_view text) -> Result<Document> {
    try {
        return Document::parse(text);
    } catch (const Document::exception& e) {
        return std::unexpected(make_error(
            ErrorCode::UnrecognizedFormat, "Invalid JSON", e.what()));
    }
}

auto read_file(const std::filesystem::path& path) -> Result<std::string> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::unexpected(make_error(
            ErrorCode::IoError, "Input file does not exist", path.string()));
    }
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::unexpected(make_error(
            ErrorCode::IoError, "Input path is not a regular file", path.string()));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected(make_error(
            ErrorCode::IoError,
            "Cannot open input file",
            path.string() + ": " + std::strerror(errno)));
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return std::unexpected(make_error(
            ErrorCode::IoError, "Failed to read input file", path.string()));
    }
    return buffer.str();
}

FormatLoader::FormatLoader()
    : attempts_(default_attempts()) {}

FormatLoader::FormatLoader(std::vector<ParseAttempt> attempts)
    : attempts_(std::move(attempts)) {}

auto FormatLoader::default_attempts() -> std::vector<ParseAttempt> {
    return {
        ParseAttempt{Format::Yaml, parse_yaml},
        ParseAttempt{Format::Json, parse_json},
    };
}

auto FormatLoader::load_text(std::string_view text, std::string_view origin) const
    -> Result<LoadedDocument>
{
    std::vector<std::string> failures;
    for (const auto& attempt : attempts_) {
        auto parsed = attempt.parse(text);
        if (parsed) {
            LOG_DEBUG("Parsed {} as {}", origin, format_name(attempt.format));
            return LoadedDocument{std::move(*parsed), attempt.format};
        }
        LOG_DEBUG("{} is not valid {}: {}", origin, format_name(attempt.format),
                  parsed.error().what());
        failures.push_back(std::string(format_name(attempt.format)) + ": " +
                           std::string(parsed.error().detail()));
    }

    return std::unexpected(make_error(
        ErrorCode::UnrecognizedFormat,
        "Failed to load " + std::string(origin) + " as any supported format",
        utils::join(failures, "; ")));
}

auto FormatLoader::load_file(const std::filesystem::path& path) const -> Result<LoadedDocument> {
    auto text = read_file(path);
    if (!text) {
        return std::unexpected(text.error());
    }
    return load_text(*text, path.string());
}

} // namespace obfuscator::format
