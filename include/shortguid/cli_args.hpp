#pragma once

#include <shortguid/config.hpp>
#include <shortguid/result.hpp>
#include <optional>
#include <string>

namespace shortguid {

extern const char* const cli_usage_text;

// Parsed command line of shortguid-cli.
struct CliArgs {
    std::string command;   // "convert", or "random" in builds with random support
    std::string input_id;
    std::optional<OutputFormat> format;
    std::optional<std::string> config_path;
    int verbosity = 0;
    bool help = false;
};

// argv[0] is skipped. Errors are InvalidArg, with the usage text as the hint
// where a command is missing or unknown.
Result<CliArgs> parse_cli_args(int argc, const char* const* argv);

} // namespace shortguid
