#include "docguard/cli/app.hpp"
#include "docguard/core/logger.hpp"

#include <exception>
#include <iostream>

// Version string; typically injected by CMake via -DDOCGUARD_VERSION_STRING=...
#ifndef DOCGUARD_VERSION_STRING
#define DOCGUARD_VERSION_STRING "0.1.0-dev"
#endif

namespace docguard::cli {

App::App()
    : cli_("docguard", "Allow-listed, traversal-safe file access for project tooling")
{
    cli_.set_version_flag("--version", DOCGUARD_VERSION_STRING,
                          "Display version information");

    cli_.add_option("-r,--root", ctx_.root,
                    "Project root that every path is resolved under")
        ->envname("DOCGUARD_ROOT")
        ->check(CLI::ExistingDirectory)
        ->capture_default_str();

    cli_.add_option("-c,--config", ctx_.config_path,
                    "Path to configuration file (JSON)")
        ->envname("DOCGUARD_CONFIG")
        ->check(CLI::ExistingFile);

    ctx_.log_level_option = cli_.add_option("--log-level", ctx_.config.log_level,
                                            "Log level (trace, debug, info, warn, error, critical, off)")
        ->envname("DOCGUARD_LOG_LEVEL")
        ->default_val("warn");

    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    } catch (const std::exception& e) {
        LOG_ERROR("Command failed: {}", e.what());
        std::cerr << "error [" << error_code_to_string(ErrorCode::Unknown) << "]: "
                  << e.what() << "\n";
        Logger::flush();
        return 1;
    }

    Logger::flush();
    return ctx_.exit_code;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::context() -> CliContext& {
    return ctx_;
}

void App::setup_commands() {
    register_check_command(cli_, ctx_);
    register_probe_commands(cli_, ctx_);
    register_read_command(cli_, ctx_);
    register_walk_commands(cli_, ctx_);
    register_validate_command(cli_, ctx_);
}

} // namespace docguard::cli
