#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "obfuscator/core/document.hpp"
#include "obfuscator/core/error.hpp"
#include "obfuscator/format/format.hpp"

namespace obfuscator::format {

/// A document together with the format whose parser accepted it.
struct LoadedDocument {
    Document document;
    Format format;
};

/// One entry in the loader's ordered parser chain.
struct ParseAttempt {
    Format format;
    std::function<Result<Document>(std::string_view)> parse;
};

/// Strict JSON parse of the whole text.
auto parse_json(std::string_view text) -> Result<Document>;

/// Read a whole file into memory.
auto read_file(const std::filesystem::path& path) -> Result<std::string>;

/// Loads configuration documents by trying each parser in turn.
///
/// The default chain tries YAML first, then JSON. YAML accepts most JSON
/// on its own, so a document valid in both is reported as YAML. The first
/// parser to succeed wins; when every parser fails the result is
/// ErrorCode::UnrecognizedFormat and nothing is returned.
class FormatLoader {
public:
    FormatLoader();
    explicit FormatLoader(std::vector<ParseAttempt> attempts);

    /// Parse in-memory text. `origin` names the source in log lines.
    auto load_text(std::string_view text, std::string_view origin = "<memory>") const
        -> Result<LoadedDocument>;

    /// Read and parse a file. Missing or unreadable files yield
    /// ErrorCode::IoError.
    auto load_file(const std::filesystem::path& path) const -> Result<LoadedDocument>;

    [[nodiscard]] auto attempts() const -> const std::vector<ParseAttempt>& { return attempts_; }

    /// The default YAML-then-JSON chain.
    static auto default_attempts() -> std::vector<ParseAttempt>;

private:
    std::vector<ParseAttempt> attempts_;
};

} // namespace obfuscator::format
