#include <shortguid/cli_args.hpp>
#include <vector>

namespace shortguid {

const char* const cli_usage_text =
    "usage: shortguid-cli [-v] [--config <path>] <command>\n"
    "\n"
    "commands:\n"
    "  convert <id> [-s|--short | -l|--long]   print the given ID\n"
#ifdef SHORTGUID_ENABLE_RANDOM
    "  random                                 print a new random ID\n"
#endif
    ;

Result<CliArgs> parse_cli_args(int argc, const char* const* argv) {
    CliArgs args;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-h" || a == "--help") {
            args.help = true;
            return Result<CliArgs>::ok(std::move(args));
        } else if (a == "-v" || a == "--verbose") {
            ++args.verbosity;
        } else if (a == "-s" || a == "--short" || a == "-l" || a == "--long") {
            auto f = (a == "-s" || a == "--short") ? OutputFormat::Short : OutputFormat::Long;
            if (args.format.has_value() && *args.format != f) {
                return ShortGuidError{ShortGuidError::InvalidArg,
                    "--short and --long cannot be combined"};
            }
            args.format = f;
        } else if (a == "--config") {
            if (i + 1 >= argc) {
                return ShortGuidError{ShortGuidError::InvalidArg,
                    "--config requires a path"};
            }
            args.config_path = argv[++i];
        } else if (!a.empty() && a[0] == '-' && a != "-") {
            return ShortGuidError{ShortGuidError::InvalidArg,
                "unknown option: " + a, cli_usage_text};
        } else {
            positional.push_back(a);
        }
    }

    if (positional.empty()) {
        return ShortGuidError{ShortGuidError::InvalidArg, "no command given", cli_usage_text};
    }
    args.command = positional[0];

    if (args.command == "convert") {
        if (positional.size() != 2) {
            return ShortGuidError{ShortGuidError::InvalidArg,
                "convert takes exactly one ID", cli_usage_text};
        }
        args.input_id = positional[1];
#ifdef SHORTGUID_ENABLE_RANDOM
    } else if (args.command == "random") {
        if (positional.size() != 1) {
            return ShortGuidError{ShortGuidError::InvalidArg,
                "random takes no arguments", cli_usage_text};
        }
#endif
    } else {
        return ShortGuidError{ShortGuidError::InvalidArg,
            "unknown command: " + args.command, cli_usage_text};
    }

    return Result<CliArgs>::ok(std::move(args));
}

} // namespace shortguid
