#include <catch2/catch.hpp>
#include <shortguid/config.hpp>
#include <cstdio>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace shortguid;

// ===== Parsing =====

TEST_CASE("parse config with output section", "[config]") {
    auto r = Config::parse(R"(
[output]
format = "short"
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().format == OutputFormat::Short);
    REQUIRE(r.value().format_set);
    REQUIRE_FALSE(r.value().log_level_set);
}

TEST_CASE("parse config with log section", "[config]") {
    auto r = Config::parse(R"(
[log]
level = "debug"
color = false
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().log_level == log::Debug);
    REQUIRE(r.value().log_level_set);
    REQUIRE(r.value().color.has_value());
    REQUIRE(*r.value().color == false);
}

TEST_CASE("parse empty config", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().format == OutputFormat::All);
    REQUIRE(r.value().log_level == log::Warn);
    REQUIRE_FALSE(r.value().color.has_value());
}

TEST_CASE("parse invalid TOML config", "[config]") {
    auto r = Config::parse("not valid [toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ShortGuidError::Parse);
}

TEST_CASE("parse rejects unknown values", "[config]") {
    auto fmt = Config::parse("[output]\nformat = \"medium\"\n");
    REQUIRE(fmt.is_err());
    REQUIRE(fmt.error().code == ShortGuidError::Config);

    auto lvl = Config::parse("[log]\nlevel = \"shouting\"\n");
    REQUIRE(lvl.is_err());
    REQUIRE(lvl.error().code == ShortGuidError::Config);

    auto color = Config::parse("[log]\ncolor = \"yes\"\n");
    REQUIRE(color.is_err());
    REQUIRE(color.error().code == ShortGuidError::Config);

    auto type = Config::parse("[output]\nformat = 3\n");
    REQUIRE(type.is_err());
    REQUIRE(type.error().code == ShortGuidError::Config);
}

TEST_CASE("parse ignores unknown keys", "[config]") {
    log::set_level(log::Error);
    auto r = Config::parse(R"(
[output]
format = "long"
width = 80

[extras]
enabled = true
)");
    log::set_level(log::Warn);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().format == OutputFormat::Long);
}

TEST_CASE("format names round-trip", "[config]") {
    for (auto f : {OutputFormat::Short, OutputFormat::Long, OutputFormat::All}) {
        auto r = parse_format(format_name(f));
        REQUIRE(r.is_ok());
        REQUIRE(r.value() == f);
    }
}

// ===== Loading =====

TEST_CASE("load reads a file from disk", "[config]") {
    std::string path = "/tmp/shortguid_test_config_" + std::to_string(getpid()) + ".toml";
    {
        std::ofstream f(path);
        f << "[output]\nformat = \"long\"\n";
    }
    auto r = Config::load(path);
    std::remove(path.c_str());
    REQUIRE(r.is_ok());
    REQUIRE(r.value().format == OutputFormat::Long);
}

TEST_CASE("load of a missing file is an IO error", "[config]") {
    auto r = Config::load("/nonexistent/shortguid/config.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ShortGuidError::IO);
}

// ===== Merge / effective =====

TEST_CASE("merge overrides only explicit keys", "[config]") {
    auto base = Config::parse(R"(
[output]
format = "short"

[log]
level = "info"
color = true
)").value();

    auto overlay = Config::parse(R"(
[log]
level = "error"
)").value();

    base.merge(overlay);
    REQUIRE(base.format == OutputFormat::Short);   // preserved
    REQUIRE(base.log_level == log::Error);         // overridden
    REQUIRE(base.color == true);                   // preserved
}

TEST_CASE("effective config layering", "[config]") {
    auto global = Config::parse(R"(
[output]
format = "short"

[log]
level = "info"
)").value();

    auto local = Config::parse(R"(
[output]
format = "long"
)").value();

    auto eff = Config::effective(global, local);
    REQUIRE(eff.format == OutputFormat::Long);
    REQUIRE(eff.log_level == log::Info);
}

TEST_CASE("effective with no layers", "[config]") {
    auto eff = Config::effective({}, {});
    REQUIRE(eff.format == OutputFormat::All);
    REQUIRE_FALSE(eff.format_set);
}

// ===== Global config path =====

TEST_CASE("global config path contains .shortguid", "[config]") {
    auto path = global_config_path();
    // May be empty if HOME is not set, but if set, should contain .shortguid
    if (!path.empty()) {
        REQUIRE(path.find(".shortguid/config.toml") != std::string::npos);
    }
}
