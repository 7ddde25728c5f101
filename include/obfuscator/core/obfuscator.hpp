#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "obfuscator/core/error.hpp"
#include "obfuscator/format/loader.hpp"
#include "obfuscator/redact/patterns.hpp"
#include "obfuscator/redact/redactor.hpp"

namespace obfuscator {

/// Inputs for one obfuscation run.
struct Options {
    std::string input_file;
    std::string output_file;  // empty = overwrite input_file
    std::string placeholder = redact::kDefaultPlaceholder;

    [[nodiscard]] auto effective_output() const -> std::filesystem::path {
        return output_file.empty() ? std::filesystem::path(input_file)
                                   : std::filesystem::path(output_file);
    }
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Options, input_file, output_file, placeholder)

/// Loads one configuration file, redacts it and writes the result.
///
/// Each instance handles exactly one file and owns its document for the
/// duration of run(). Instances share nothing but the read-only pattern
/// set, so a batch is just a sequence of independent runs.
class ConfigObfuscator {
public:
    explicit ConfigObfuscator(Options options,
                              const redact::SensitivityPatterns& patterns =
                                  redact::SensitivityPatterns::defaults());

    /// Load, redact and write. Nothing is written unless loading and
    /// redaction both succeed.
    auto run() const -> VoidResult;

    [[nodiscard]] auto options() const noexcept -> const Options& { return options_; }

private:
    Options options_;
    format::FormatLoader loader_;
    redact::Redactor redactor_;
};

} // namespace obfuscator
