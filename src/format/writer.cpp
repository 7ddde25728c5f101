#include "obfuscator/format/writer.hpp"
#include "obfuscator/core/logger.hpp"
#include "obfuscator/format/yaml_codec.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>

namespace obfuscator::format {

auto serialize(const Document& doc, Format format) -> Result<std::string> {
    if (format == Format::Yaml) {
        return emit_yaml(doc);
    }

    try {
        return doc.dump(2) + "\n";
    } catch (const Document::exception& e) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError, "Failed to serialize JSON", e.what()));
    }
}

auto write_document(const Document& doc, const std::filesystem::path& path)
    -> Result<WriteOutcome>
{
    WriteOutcome outcome{Format::Yaml, false};
    if (auto detected = format_for_path(path)) {
        outcome.format = *detected;
    } else {
        outcome.used_fallback = true;
    }

    auto text = serialize(doc, outcome.format);
    if (!text) {
        return std::unexpected(text.error());
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return std::unexpected(make_error(
            ErrorCode::WriteError,
            "Cannot open output file",
            path.string() + ": " + std::strerror(errno)));
    }

    file.write(text->data(), static_cast<std::streamsize>(text->size()));
    file.flush();
    if (!file) {
        return std::unexpected(make_error(
            ErrorCode::WriteError,
            "Failed to write output file",
            path.string() + ": " + std::strerror(errno)));
    }

    LOG_DEBUG("Wrote {} bytes of {} to {}", text->size(), format_name(outcome.format),
              path.string());
    return outcome;
}

} // namespace obfuscator::format
