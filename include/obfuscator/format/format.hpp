#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

namespace obfuscator::format {

enum class Format {
    Yaml,
    Json,
};

inline auto format_name(Format format) -> std::string_view {
    switch (format) {
        case Format::Yaml: return "YAML";
        case Format::Json: return "JSON";
        default: return "unknown";
    }
}

/// Map a file extension to a format: .yaml/.yml to YAML and .json to
/// JSON, compared case-insensitively. Anything else yields nullopt.
auto format_for_path(const std::filesystem::path& path) -> std::optional<Format>;

} // namespace obfuscator::format
