#include "obfuscator/redact/patterns.hpp"
#include "obfuscator/core/logger.hpp"

namespace obfuscator::redact {

auto default_pattern_sources() -> const std::vector<std::string>& {
    static const std::vector<std::string> sources = {
        R"((password\s*:).*)",
        R"((api_key\s*:).*)",
        R"((secret\s*:).*)",
        R"((token\s*:).*)",
        R"((access_key\s*:).*)",
        R"((credentials\s*:).*)",
        R"(("password"\s*:).*)",
        R"(("api_key"\s*:).*)",
        R"(("secret"\s*:).*)",
        R"(("token"\s*:).*)",
        R"(("access_key"\s*:).*)",
        R"(("credentials"\s*:).*)",
    };
    return sources;
}

SensitivityPatterns::SensitivityPatterns(std::vector<Entry> entries)
    : entries_(std::move(entries)) {}

auto SensitivityPatterns::defaults() -> const SensitivityPatterns& {
    // The built-in sources are known to compile.
    static const SensitivityPatterns patterns = from_sources(default_pattern_sources()).value();
    return patterns;
}

auto SensitivityPatterns::from_sources(const std::vector<std::string>& sources)
    -> Result<SensitivityPatterns>
{
    std::vector<Entry> entries;
    entries.reserve(sources.size());
    for (const auto& source : sources) {
        try {
            entries.push_back(Entry{
                source,
                std::regex(source, std::regex::ECMAScript | std::regex::icase | std::regex::optimize),
            });
        } catch (const std::regex_error& e) {
            return std::unexpected(make_error(
                ErrorCode::InvalidArgument,
                "Invalid sensitivity pattern",
                source + ": " + e.what()));
        }
    }
    LOG_TRACE("Compiled {} sensitivity patterns", entries.size());
    return SensitivityPatterns(std::move(entries));
}

auto SensitivityPatterns::match(std::string_view text) const -> std::optional<std::string_view> {
    for (const auto& entry : entries_) {
        if (std::regex_search(text.begin(), text.end(), entry.regex)) {
            return std::string_view(entry.source);
        }
    }
    return std::nullopt;
}

auto SensitivityPatterns::match_key(std::string_view key) const -> std::optional<std::string_view> {
    std::string rendered(key);
    rendered += ':';
    return match(rendered);
}

auto SensitivityPatterns::sources() const -> std::vector<std::string> {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.source);
    }
    return result;
}

} // namespace obfuscator::redact
