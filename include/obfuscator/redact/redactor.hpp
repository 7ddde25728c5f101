#pragma once

#include <string>

#include "obfuscator/core/document.hpp"
#include "obfuscator/core/error.hpp"
#include "obfuscator/redact/patterns.hpp"

namespace obfuscator::redact {

inline constexpr const char* kDefaultPlaceholder = "<REDACTED>";

/// Replaces sensitive values in a document tree with a placeholder.
///
/// A mapping value is replaced wholesale when its key matches a pattern,
/// without looking inside it. Otherwise mappings and sequences are walked
/// and string scalars are matched on their own text. Keys, sequence
/// lengths and nesting are never changed.
///
/// The redactor keeps a reference to `patterns`, which must outlive it.
class Redactor {
public:
    explicit Redactor(const SensitivityPatterns& patterns = SensitivityPatterns::defaults(),
                      std::string placeholder = kDefaultPlaceholder);

    /// Return a redacted copy of `doc`. The root must be a mapping;
    /// anything else yields ErrorCode::InvalidDocument.
    auto redact(const Document& doc) const -> Result<Document>;

    [[nodiscard]] auto placeholder() const noexcept -> const std::string& { return placeholder_; }
    [[nodiscard]] auto patterns() const noexcept -> const SensitivityPatterns& { return patterns_; }

private:
    auto redact_mapping(const Document& mapping) const -> Document;
    auto redact_sequence(const Document& sequence) const -> Document;
    auto redact_value(const Document& value) const -> Document;

    const SensitivityPatterns& patterns_;
    std::string placeholder_;
};

} // namespace obfuscator::redact
