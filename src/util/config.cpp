#include <shortguid/config.hpp>
#include <tomlplusplus/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace shortguid {

const char* format_name(OutputFormat f) {
    switch (f) {
        case OutputFormat::Short: return "short";
        case OutputFormat::Long:  return "long";
        case OutputFormat::All:   return "all";
    }
    return "unknown";
}

Result<OutputFormat> parse_format(std::string_view name) {
    if (name == "short") return Result<OutputFormat>::ok(OutputFormat::Short);
    if (name == "long")  return Result<OutputFormat>::ok(OutputFormat::Long);
    if (name == "all")   return Result<OutputFormat>::ok(OutputFormat::All);
    return ShortGuidError{ShortGuidError::Config,
        "unknown output format '" + std::string(name) + "'",
        "expected one of: short, long, all"};
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return ShortGuidError{ShortGuidError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    for (const auto& entry : doc) {
        std::string k(entry.first);
        if (k != "output" && k != "log") {
            log::warn("ignoring unknown config section [%s]", k.c_str());
        }
    }

    // [output] section
    if (auto output = doc["output"].as_table()) {
        for (const auto& [key, val] : *output) {
            std::string k(key);
            if (k == "format") {
                auto s = val.value<std::string>();
                if (!s) {
                    return ShortGuidError{ShortGuidError::Config,
                        "output.format must be a string"};
                }
                auto f = parse_format(*s);
                SHORTGUID_TRY(f);
                cfg.format = f.value();
                cfg.format_set = true;
            } else {
                log::warn("ignoring unknown config key output.%s", k.c_str());
            }
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        for (const auto& [key, val] : *lg) {
            std::string k(key);
            if (k == "level") {
                auto s = val.value<std::string>();
                if (!s) {
                    return ShortGuidError{ShortGuidError::Config,
                        "log.level must be a string"};
                }
                auto lvl = log::parse_level(*s);
                SHORTGUID_TRY(lvl);
                cfg.log_level = lvl.value();
                cfg.log_level_set = true;
            } else if (k == "color") {
                auto b = val.value<bool>();
                if (!b) {
                    return ShortGuidError{ShortGuidError::Config,
                        "log.color must be true or false"};
                }
                cfg.color = *b;
            } else {
                log::warn("ignoring unknown config key log.%s", k.c_str());
            }
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return ShortGuidError{ShortGuidError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    log::debug("loaded config %s", path.c_str());
    return Config::parse(ss.str());
}

void Config::merge(const Config& other) {
    if (other.format_set) {
        format = other.format;
        format_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.color.has_value()) {
        color = other.color;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.shortguid/config.toml";
}

} // namespace shortguid
