#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "docguard/core/config.hpp"

namespace docguard::cli {

/// State shared between the top-level app and its subcommands.
/// Global options are parsed before any subcommand callback runs.
struct CliContext {
    Config config;
    std::string config_path;
    std::string root = ".";
    int exit_code = 0;
    bool ready = false;

    /// The global `--log-level` option; its count tells an explicit level
    /// (flag or DOCGUARD_LOG_LEVEL) from the default.
    const CLI::Option* log_level_option = nullptr;

    /// Loads the config file (if any) and applies the log level. An explicit
    /// `--log-level` wins over the file's `log_level`. Safe to call more than once.
    void prepare();
};

/// `check <path>`: print the resolved path or the denial.
void register_check_command(CLI::App& app, CliContext& ctx);

/// `exists <path>` and `symlink <path>`: print true/false.
void register_probe_commands(CLI::App& app, CliContext& ctx);

/// `read <path> [--json]`: print file content.
void register_read_command(CLI::App& app, CliContext& ctx);

/// `count <dir> <pattern>` and `find <dir> <pattern>`.
void register_walk_commands(CLI::App& app, CliContext& ctx);

/// `validate`: run the plugin structure validator.
void register_validate_command(CLI::App& app, CliContext& ctx);

} // namespace docguard::cli
