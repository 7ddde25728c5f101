#pragma once

#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "obfuscator/core/obfuscator.hpp"

namespace obfuscator::cli {

/// Command-line front end.
///
/// Parses arguments with CLI11, configures logging, and runs one
/// ConfigObfuscator per input file.
class App {
public:
    App();
    ~App();

    // Non-copyable, non-movable.
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and process every input file.
    /// @returns 0 when every file succeeded, 1 when any failed, or CLI11's
    ///          exit code for argument errors.
    auto run(int argc, char** argv) -> int;

    /// Access the underlying CLI11 app (for testing or extension).
    [[nodiscard]] auto cli() -> CLI::App&;

    [[nodiscard]] auto input_files() const -> const std::vector<std::string>& { return input_files_; }

    /// Options shared by every file; input_file is filled in per run.
    [[nodiscard]] auto options() const -> const Options& { return options_; }

private:
    void setup_options();

    /// Process the parsed inputs. Returns the process exit code.
    auto process() -> int;

    CLI::App cli_;
    std::vector<std::string> input_files_;
    Options options_;
    std::string log_level_ = "info";
    bool debug_ = false;
};

} // namespace obfuscator::cli
