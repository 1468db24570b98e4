#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "docguard/core/config.hpp"

namespace fs = std::filesystem;

TEST_CASE("default_config returns sane defaults", "[config]") {
    auto cfg = docguard::default_config();

    CHECK(cfg.log_level == "info");
    CHECK(cfg.limits.max_depth == 32);
    CHECK(cfg.limits.max_entries == 100000);
    CHECK(cfg.limits.max_pattern_length == 256);
    CHECK(cfg.limits.exclude_dirs == std::vector<std::string>{"node_modules", ".git"});
    CHECK(cfg.plugin.plugin_name == "ccprompts");
    CHECK(cfg.plugin.command_phases.size() == 12);
}

TEST_CASE("load_config parses JSON file correctly", "[config]") {
    auto tmp = fs::temp_directory_path() / "docguard_test_config.json";
    {
        std::ofstream out(tmp);
        out << R"({
            "log_level": "debug",
            "limits": { "max_depth": 4, "exclude_dirs": ["build"] },
            "plugin": { "plugin_name": "my-plugin", "command_phases": [] }
        })";
    }

    auto cfg = docguard::load_config(tmp);

    CHECK(cfg.log_level == "debug");
    CHECK(cfg.limits.max_depth == 4);
    CHECK(cfg.limits.exclude_dirs == std::vector<std::string>{"build"});
    // Non-specified fields keep defaults
    CHECK(cfg.limits.max_entries == 100000);
    CHECK(cfg.plugin.plugin_name == "my-plugin");
    CHECK(cfg.plugin.command_phases.empty());

    fs::remove(tmp);
}

TEST_CASE("load_config returns defaults for missing or malformed files", "[config]") {
    SECTION("missing") {
        auto cfg = docguard::load_config("/nonexistent/path/docguard.json");
        CHECK(cfg.log_level == "info");
        CHECK(cfg.limits.max_depth == 32);
    }

    SECTION("malformed") {
        auto tmp = fs::temp_directory_path() / "docguard_test_bad_config.json";
        {
            std::ofstream out(tmp);
            out << "{ not json";
        }
        auto cfg = docguard::load_config(tmp);
        CHECK(cfg.limits.max_depth == 32);
        fs::remove(tmp);
    }
}

TEST_CASE("load_config ignores access policy keys", "[config]") {
    auto tmp = fs::temp_directory_path() / "docguard_test_policy_config.json";
    {
        std::ofstream out(tmp);
        out << R"({ "documented_dirs": ["src", "/etc"], "log_level": "warn" })";
    }

    auto cfg = docguard::load_config(tmp);
    CHECK(cfg.log_level == "warn");

    fs::remove(tmp);
}

TEST_CASE("load_config rejects zero walk limits", "[config]") {
    auto tmp = fs::temp_directory_path() / "docguard_test_zero_config.json";
    {
        std::ofstream out(tmp);
        out << R"({ "limits": { "max_depth": 0, "max_entries": 10 } })";
    }

    auto cfg = docguard::load_config(tmp);
    CHECK(cfg.limits.max_depth == 32);
    CHECK(cfg.limits.max_entries == 100000);

    fs::remove(tmp);
}

TEST_CASE("load_config rejects negative walk limits", "[config]") {
    auto tmp = fs::temp_directory_path() / "docguard_test_negative_config.json";
    {
        std::ofstream out(tmp);
        out << R"({ "log_level": "debug", "limits": { "max_depth": -1, "max_entries": 10 } })";
    }

    auto cfg = docguard::load_config(tmp);
    CHECK(cfg.log_level == "debug");
    CHECK(cfg.limits.max_depth == 32);
    CHECK(cfg.limits.max_entries == 100000);

    fs::remove(tmp);
}

TEST_CASE("load_config_from_env ignores negative limits", "[config]") {
    ::setenv("DOCGUARD_MAX_DEPTH", "-1", 1);
    ::setenv("DOCGUARD_MAX_ENTRIES", "+20", 1);

    auto cfg = docguard::load_config_from_env();

    CHECK(cfg.limits.max_depth == 32);
    CHECK(cfg.limits.max_entries == 100000);

    ::unsetenv("DOCGUARD_MAX_DEPTH");
    ::unsetenv("DOCGUARD_MAX_ENTRIES");
}

TEST_CASE("load_config_from_env reads environment variables", "[config]") {
    ::setenv("DOCGUARD_LOG_LEVEL", "trace", 1);
    ::setenv("DOCGUARD_MAX_DEPTH", "7", 1);
    ::setenv("DOCGUARD_MAX_ENTRIES", "not-a-number", 1);

    auto cfg = docguard::load_config_from_env();

    CHECK(cfg.log_level == "trace");
    CHECK(cfg.limits.max_depth == 7);
    CHECK(cfg.limits.max_entries == 100000);

    ::unsetenv("DOCGUARD_LOG_LEVEL");
    ::unsetenv("DOCGUARD_MAX_DEPTH");
    ::unsetenv("DOCGUARD_MAX_ENTRIES");
}

TEST_CASE("Config round-trips through JSON", "[config]") {
    docguard::Config cfg;
    cfg.log_level = "error";
    cfg.limits.max_entries = 50;

    docguard::json j = cfg;
    auto restored = j.get<docguard::Config>();

    CHECK(restored.log_level == "error");
    CHECK(restored.limits.max_entries == 50);
    CHECK(restored.limits.max_depth == 32);
}
