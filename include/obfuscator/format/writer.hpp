#pragma once

#include <filesystem>
#include <string>

#include "obfuscator/core/document.hpp"
#include "obfuscator/core/error.hpp"
#include "obfuscator/format/format.hpp"

namespace obfuscator::format {

/// What write_document() actually did.
struct WriteOutcome {
    Format format;
    /// True when the output extension was not recognized and YAML was
    /// chosen as the fallback.
    bool used_fallback = false;
};

/// Serialize a document with two-space indentation and a trailing newline.
auto serialize(const Document& doc, Format format) -> Result<std::string>;

/// Serialize `doc` in the format chosen by the extension of `path` and
/// write it there. The output is fully serialized before the file is
/// opened. The write itself is not transactional.
auto write_document(const Document& doc, const std::filesystem::path& path)
    -> Result<WriteOutcome>;

} // namespace obfuscator::format
