#pragma once

#include <string>
#include <string_view>

#include "obfuscator/core/document.hpp"
#include "obfuscator/core/error.hpp"

namespace obfuscator::format {

/// Resolve the text of a plain (unquoted, untagged) YAML scalar to a
/// typed Document value using YAML 1.1 rules: null, boolean, integer
/// (decimal, 0x, 0o, 0b, with '_' separators), float (including .inf and
/// .nan). Text that fits none of these stays a string.
auto resolve_plain_scalar(std::string_view text) -> Document;

/// Parse a single-document YAML stream. An empty stream yields null.
auto parse_yaml(std::string_view text) -> Result<Document>;

/// Emit a document as block-style YAML with two-space indentation.
/// Strings that would read back as another type are double-quoted.
auto emit_yaml(const Document& doc) -> Result<std::string>;

} // namespace obfuscator::format
