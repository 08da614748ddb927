// shortguid_cli.cpp
//
// Converts identifiers between their short and long representations.
//
//     shortguid-cli convert c9a646d3-9c61-4cb7-bfcd-ee2522c8f633
//     shortguid-cli convert yaZG05xhTLe_ze4lIsj2Mw --long
//     shortguid-cli random
//
// Settings come from ~/.shortguid/config.toml, then --config <path>.
// Command-line flags win over both.

#include <shortguid/base64.hpp>
#include <shortguid/cli_args.hpp>
#include <shortguid/config.hpp>
#include <shortguid/log.hpp>
#include <shortguid/short_guid.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace fs = std::filesystem;
using namespace shortguid;

namespace {

Result<Config> load_config(const CliArgs& args) {
    std::optional<Config> global;
    std::string global_path = global_config_path();
    if (!global_path.empty() && fs::exists(global_path)) {
        auto g = Config::load(global_path);
        SHORTGUID_TRY(g);
        global = g.value();
    }

    std::optional<Config> local;
    if (args.config_path.has_value()) {
        auto l = Config::load(*args.config_path);
        SHORTGUID_TRY(l);
        local = l.value();
    }

    return Result<Config>::ok(Config::effective(global, local));
}

void print_all(const ShortGuid& id) {
    const Bytes& bytes = id.as_bytes();
    ShortGuid le = ShortGuid::from_bytes(id.to_bytes_le());

    std::cout << "Short UUID:                  " << id << "\n"
              << "Base 64:                     " << base64::encode_standard(bytes.data(), bytes.size()) << "\n"
              << "UUID:                        " << id.as_uuid().to_string() << "\n"
              << "                             " << id.as_uuid().to_hex() << "\n"
              << "Short UUID (little endian):  " << le << "\n"
              << "UUID (little endian):        " << le.as_uuid().to_string() << "\n";
}

Status run(const CliArgs& args, const Config& cfg) {
#ifdef SHORTGUID_ENABLE_RANDOM
    if (args.command == "random") {
        print_all(ShortGuid::new_random());
        return ok_status();
    }
#endif

    log::debug("parsing '%s'", args.input_id.c_str());
    auto id = ShortGuid::try_parse(args.input_id);
    SHORTGUID_TRY(id);

    OutputFormat format = args.format.value_or(cfg.format);
    log::debug("output format: %s", format_name(format));
    switch (format) {
        case OutputFormat::Short:
            std::cout << id.value() << "\n";
            break;
        case OutputFormat::Long:
            std::cout << id.value().as_uuid().to_string() << "\n";
            break;
        case OutputFormat::All:
            print_all(id.value());
            break;
    }
    return ok_status();
}

} // namespace

int main(int argc, char** argv) {
    auto args = parse_cli_args(argc, argv);
    if (args.is_err()) {
        std::cerr << args.error().format() << "\n";
        return 1;
    }
    if (args.value().help) {
        std::cout << cli_usage_text;
        return 0;
    }

    auto cfg = load_config(args.value());
    if (cfg.is_err()) {
        std::cerr << cfg.error().format() << "\n";
        return 1;
    }

    log::set_level(cfg.value().log_level);
    if (args.value().verbosity > 0) {
        int lvl = static_cast<int>(log::get_level()) - args.value().verbosity;
        log::set_level(static_cast<log::Level>(lvl < log::Trace ? log::Trace : lvl));
    }
    if (cfg.value().color.has_value()) {
        log::set_color_enabled(*cfg.value().color);
    }

    auto status = run(args.value(), cfg.value());
    if (status.is_err()) {
        log::error("%s failed", args.value().command.c_str());
        std::cerr << status.error().format() << "\n";
        return 1;
    }
    return 0;
}
