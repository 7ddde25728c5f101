#include "obfuscator/redact/redactor.hpp"
#include "obfuscator/core/logger.hpp"

namespace obfuscator::redact {

Redactor::Redactor(const SensitivityPatterns& patterns, std::string placeholder)
    : patterns_(patterns), placeholder_(std::move(placeholder)) {}

auto Redactor::redact(const Document& doc) const -> Result<Document> {
    if (kind_of(doc) != NodeKind::Mapping) {
        return std::unexpected(make_error(
            ErrorCode::InvalidDocument,
            "Document root must be a mapping",
            "found " + std::string(doc.type_name())));
    }
    return redact_mapping(doc);
}

auto Redactor::redact_mapping(const Document& mapping) const -> Document {
    Document result = Document::object();
    for (auto it = mapping.begin(); it != mapping.end(); ++it) {
        // Key match wins: the value is blanked without being inspected.
        if (auto pattern = patterns_.match_key(it.key())) {
            LOG_DEBUG("Redacting value of key '{}' (pattern {})", it.key(), *pattern);
            result[it.key()] = placeholder_;
            continue;
        }
        result[it.key()] = redact_value(*it);
    }
    return result;
}

auto Redactor::redact_sequence(const Document& sequence) const -> Document {
    Document result = Document::array();
    for (const auto& item : sequence) {
        result.push_back(redact_value(item));
    }
    return result;
}

auto Redactor::redact_value(const Document& value) const -> Document {
    switch (kind_of(value)) {
        case NodeKind::Mapping:
            return redact_mapping(value);
        case NodeKind::Sequence:
            return redact_sequence(value);
        case NodeKind::Scalar:
            break;
    }

    if (!value.is_string()) {
        return value;
    }
    if (auto pattern = patterns_.match(value.get_ref<const std::string&>())) {
        LOG_DEBUG("Redacting string value (pattern {})", *pattern);
        return placeholder_;
    }
    return value;
}

} // namespace obfuscator::redact
