#pragma once

#include <CLI/CLI.hpp>

#include "docguard/cli/commands.hpp"
#include "docguard/core/config.hpp"

namespace docguard::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11 and dispatches to the
/// registered subcommands. The subcommand's exit status is returned from
/// run().
class App {
public:
    App();
    ~App();

    // Non-copyable, non-movable.
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    /// Access the underlying CLI11 app (for testing or extension).
    [[nodiscard]] auto cli() -> CLI::App&;

    [[nodiscard]] auto context() -> CliContext&;

private:
    void setup_commands();

    CLI::App cli_;
    CliContext ctx_;
};

} // namespace docguard::cli
