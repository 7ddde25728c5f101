#pragma once

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "obfuscator/core/error.hpp"

namespace obfuscator::redact {

/// Immutable, ordered set of case-insensitive patterns that mark a key or
/// a string value as sensitive. Safe to share read-only between runs.
class SensitivityPatterns {
public:
    /// The built-in set: password, api_key, secret, token, access_key and
    /// credentials, each as `name:` and as `"name":`.
    static auto defaults() -> const SensitivityPatterns&;

    /// Compile a custom set. Fails with ErrorCode::InvalidArgument on the
    /// first pattern that is not a valid regular expression.
    static auto from_sources(const std::vector<std::string>& sources)
        -> Result<SensitivityPatterns>;

    /// Source text of the first pattern found anywhere in `text`.
    [[nodiscard]] auto match(std::string_view text) const -> std::optional<std::string_view>;

    /// Match a mapping key through its `key:` rendering, so patterns shaped
    /// like `password\s*:` select on key identity.
    [[nodiscard]] auto match_key(std::string_view key) const -> std::optional<std::string_view>;

    [[nodiscard]] auto size() const noexcept -> size_t { return entries_.size(); }
    [[nodiscard]] auto sources() const -> std::vector<std::string>;

private:
    struct Entry {
        std::string source;
        std::regex regex;
    };

    explicit SensitivityPatterns(std::vector<Entry> entries);

    std::vector<Entry> entries_;
};

/// Source texts of the built-in pattern set, in match order.
auto default_pattern_sources() -> const std::vector<std::string>&;

} // namespace obfuscator::redact
