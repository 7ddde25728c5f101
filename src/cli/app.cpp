#include "obfuscator/cli/app.hpp"
#include "obfuscator/core/logger.hpp"

// Version string; typically injected by CMake via -DOBFUSCATOR_VERSION_STRING=...
#ifndef OBFUSCATOR_VERSION_STRING
#define OBFUSCATOR_VERSION_STRING "0.1.0-dev"
#endif

namespace obfuscator::cli {

App::App()
    : cli_("Redacts sensitive data in configuration files.", "config-obfuscator")
{
    cli_.set_version_flag("--version", OBFUSCATOR_VERSION_STRING,
                          "Display version information");
    setup_options();
}

App::~App() = default;

void App::setup_options() {
    cli_.add_option("input_file", input_files_,
                    "Path to the input configuration file(s)")
        ->required();

    cli_.add_option("-o,--output,--output_file", options_.output_file,
                    "Path to the output file. If not specified, overwrites the input file");

    cli_.add_option("-p,--placeholder", options_.placeholder,
                    "Placeholder string to replace sensitive data with")
        ->capture_default_str();

    cli_.add_option("--log-level", log_level_,
                    "Log level (trace, debug, info, warn, error, critical)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical"}))
        ->capture_default_str();

    cli_.add_flag("-d,--debug", debug_, "Enable debug logging");
}

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }

    Logger::init("config-obfuscator", debug_ ? "debug" : log_level_);
    return process();
}

auto App::process() -> int {
    if (!options_.output_file.empty() && input_files_.size() > 1) {
        LOG_ERROR("--output can only be used with a single input file ({} given)",
                  input_files_.size());
        return 1;
    }

    LOG_DEBUG("Input files: {}", input_files_.size());
    LOG_DEBUG("Output file: {}", options_.output_file.empty() ? "<input>" : options_.output_file);
    LOG_DEBUG("Placeholder: {}", options_.placeholder);

    size_t failures = 0;
    for (const auto& input : input_files_) {
        Options run_options = options_;
        run_options.input_file = input;

        ConfigObfuscator obfuscator(std::move(run_options));
        auto result = obfuscator.run();
        if (!result) {
            LOG_ERROR("[{}] {}", error_code_to_string(result.error().code()),
                      result.error().what());
            ++failures;
        }
    }

    if (failures > 0) {
        LOG_ERROR("{} of {} file(s) failed", failures, input_files_.size());
        Logger::flush();
        return 1;
    }

    LOG_INFO("Configuration obfuscation completed successfully.");
    Logger::flush();
    return 0;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

} // namespace obfuscator::cli
