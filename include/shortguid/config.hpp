#pragma once

#include <shortguid/result.hpp>
#include <shortguid/log.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace shortguid {

// What `shortguid-cli convert` prints.
enum class OutputFormat {
    Short,  // 22-character form only
    Long,   // dashed UUID only
    All     // every representation
};

const char* format_name(OutputFormat f);
Result<OutputFormat> parse_format(std::string_view name);

// CLI settings, layered: global (~/.shortguid/config.toml) then --config.
// Later layers override only the keys they set explicitly.
struct Config {
    OutputFormat format = OutputFormat::All;
    log::Level log_level = log::Warn;
    // Unset means "color when stderr is a terminal".
    std::optional<bool> color;

    bool format_set = false;
    bool log_level_set = false;

    static Result<Config> load(const std::string& path);
    static Result<Config> parse(const std::string& toml_str);

    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);
};

// $HOME/.shortguid/config.toml, or "" when no home directory is known.
std::string global_config_path();

} // namespace shortguid
