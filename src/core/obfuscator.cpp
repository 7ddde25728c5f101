#include "obfuscator/core/obfuscator.hpp"
#include "obfuscator/core/logger.hpp"
#include "obfuscator/format/writer.hpp"

namespace obfuscator {

ConfigObfuscator::ConfigObfuscator(Options options, const redact::SensitivityPatterns& patterns)
    : options_(std::move(options))
    , redactor_(patterns, options_.placeholder) {}

auto ConfigObfuscator::run() const -> VoidResult {
    LOG_DEBUG("Run options: {}", nlohmann::json(options_).dump());

    const std::filesystem::path input(options_.input_file);
    auto loaded = loader_.load_file(input);
    if (!loaded) {
        return std::unexpected(loaded.error());
    }
    LOG_INFO("Successfully loaded {} as {}", input.string(), format::format_name(loaded->format));

    if (loaded->document.is_null()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidDocument, "Document is empty", input.string()));
    }

    auto redacted = redactor_.redact(loaded->document);
    if (!redacted) {
        return std::unexpected(redacted.error());
    }
    if (!preserves_shape(loaded->document, *redacted)) {
        return std::unexpected(make_error(
            ErrorCode::InternalError,
            "Redaction changed the document structure",
            input.string()));
    }

    auto output = options_.effective_output();
    auto written = format::write_document(*redacted, output);
    if (!written) {
        return std::unexpected(written.error());
    }
    if (written->used_fallback) {
        LOG_WARN("Unknown file extension for {}. Saved as YAML.", output.string());
    }

    LOG_INFO("Successfully saved obfuscated config to {} as {}", output.string(),
             format::format_name(written->format));
    return ok_result();
}

} // namespace obfuscator
