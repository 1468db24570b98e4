#include <catch2/catch_test_macros.hpp>

#include "docguard/cli/app.hpp"
#include "docguard/core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

auto run_cli(std::vector<std::string> args) -> int {
    args.insert(args.begin(), "docguard");
    std::vector<char*> argv;
    for (auto& a : args) {
        argv.push_back(a.data());
    }
    docguard::cli::App app;
    return app.run(static_cast<int>(argv.size()), argv.data());
}

struct TempRoot {
    fs::path root;

    TempRoot() {
        std::random_device rd;
        root = fs::temp_directory_path() / ("docguard_cli_" + std::to_string(rd()));
        fs::create_directories(root / "docs");
        std::ofstream(root / "docs" / "guide.md") << "# guide";
        std::ofstream(root / "package.json") << R"({"name": "x", "version": "1"})";
    }

    ~TempRoot() {
        std::error_code ec;
        fs::remove_all(root, ec);
    }
};

} // anonymous namespace

TEST_CASE("check exits 0 for allowed paths and 2 for denials", "[cli]") {
    TempRoot tmp;
    auto root = tmp.root.string();

    CHECK(run_cli({"--log-level", "off", "--root", root, "check", "docs/guide.md"}) == 0);
    CHECK(run_cli({"--log-level", "off", "--root", root, "check", "../etc/passwd"}) == 2);
    CHECK(run_cli({"--log-level", "off", "--root", root, "check", "src/main.cpp"}) == 2);
}

TEST_CASE("read and count report failures through the exit code", "[cli]") {
    TempRoot tmp;
    auto root = tmp.root.string();

    CHECK(run_cli({"--log-level", "off", "--root", root, "read", "docs/guide.md"}) == 0);
    CHECK(run_cli({"--log-level", "off", "--root", root, "read", "--json", "package.json"}) == 0);
    CHECK(run_cli({"--log-level", "off", "--root", root, "read", "docs/missing.md"}) == 1);
    CHECK(run_cli({"--log-level", "off", "--root", root, "count", "docs", "*.md"}) == 0);
    CHECK(run_cli({"--log-level", "off", "--root", root, "count", "src", "*.md"}) == 2);
}

TEST_CASE("validate fails for an incomplete plugin", "[cli]") {
    TempRoot tmp;
    CHECK(run_cli({"--log-level", "off", "--root", tmp.root.string(), "validate"}) == 1);
}

TEST_CASE("validate survives a malformed marketplace entry", "[cli]") {
    TempRoot tmp;
    fs::create_directories(tmp.root / ".claude-plugin");
    std::ofstream(tmp.root / ".claude-plugin" / "marketplace.json") << R"({"plugins": [{"name": 5}]})";

    CHECK(run_cli({"--log-level", "off", "--root", tmp.root.string(), "validate"}) == 1);
}

TEST_CASE("the config file log level applies unless --log-level is given", "[cli]") {
    TempRoot tmp;
    auto config = tmp.root / "docguard.json";
    std::ofstream(config) << R"({"log_level": "error"})";
    auto root = tmp.root.string();

    auto parse = [&](std::vector<std::string> args) -> std::string {
        args.insert(args.begin(), "docguard");
        std::vector<char*> argv;
        for (auto& a : args) {
            argv.push_back(a.data());
        }
        docguard::cli::App app;
        REQUIRE(app.run(static_cast<int>(argv.size()), argv.data()) == 0);
        return app.context().config.log_level;
    };

    CHECK(parse({"--root", root, "--config", config.string(), "count", "docs", "*.md"}) == "error");
    CHECK(parse({"--root", root, "--config", config.string(), "--log-level", "off",
                 "count", "docs", "*.md"}) == "off");
    CHECK(parse({"--root", root, "--log-level", "off", "count", "docs", "*.md"}) == "off");

    docguard::Logger::set_level("off");
}

TEST_CASE("a subcommand is required", "[cli]") {
    CHECK(run_cli({"--log-level", "off"}) != 0);
}
