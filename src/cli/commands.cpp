#include "docguard/cli/commands.hpp"

#include "docguard/core/logger.hpp"
#include "docguard/infra/file_accessor.hpp"
#include "docguard/infra/path_guard.hpp"
#include "docguard/plugin/validator.hpp"

#include <filesystem>
#include <iostream>
#include <memory>

namespace docguard::cli {

namespace {

constexpr int kExitFailure = 1;
constexpr int kExitDenied = 2;

auto make_accessor(const CliContext& ctx) -> infra::FileAccessor {
    return infra::FileAccessor(infra::PathGuard{}, ctx.config.limits);
}

/// Prints `err` to stderr and returns the matching exit code.
auto report_error(const Error& err) -> int {
    if (err.is_denial()) {
        std::cerr << "denied [" << denial_reason_to_string(err.reason()) << "]: "
                  << err.what() << "\n";
        return kExitDenied;
    }
    std::cerr << "error [" << error_code_to_string(err.code()) << "]: " << err.what() << "\n";
    return kExitFailure;
}

} // anonymous namespace

void CliContext::prepare() {
    if (ready) return;

    auto cli_level = config.log_level;
    bool explicit_level = log_level_option != nullptr && log_level_option->count() > 0;
    Logger::init("docguard", cli_level);

    if (!config_path.empty()) {
        LOG_INFO("Loading configuration from: {}", config_path);
        config = load_config(std::filesystem::path(config_path));
        if (explicit_level) {
            config.log_level = cli_level;
        }
    } else {
        config = load_config_from_env();
        config.log_level = cli_level;
    }
    Logger::set_level(config.log_level);

    ready = true;
}

// ---------------------------------------------------------------------------
// check
// ---------------------------------------------------------------------------

void register_check_command(CLI::App& app, CliContext& ctx) {
    auto* sub = app.add_subcommand("check", "Validate a path against the access policy");

    auto path = std::make_shared<std::string>();
    sub->add_option("path", *path, "Root-relative path")->required();

    sub->callback([&ctx, path]() {
        ctx.prepare();
        infra::PathGuard guard;
        auto resolved = guard.validate(*path, ctx.root);
        if (!resolved) {
            ctx.exit_code = report_error(resolved.error());
            return;
        }
        std::cout << resolved->string() << "\n";
    });
}

// ---------------------------------------------------------------------------
// exists / symlink
// ---------------------------------------------------------------------------

void register_probe_commands(CLI::App& app, CliContext& ctx) {
    auto* exists_cmd = app.add_subcommand("exists", "Print whether an allowed path exists");
    auto exists_path = std::make_shared<std::string>();
    exists_cmd->add_option("path", *exists_path, "Root-relative path")->required();
    exists_cmd->callback([&ctx, exists_path]() {
        ctx.prepare();
        auto files = make_accessor(ctx);
        std::cout << (files.exists(*exists_path, ctx.root) ? "true" : "false") << "\n";
    });

    auto* link_cmd = app.add_subcommand("symlink", "Print whether an allowed path is a symlink");
    auto link_path = std::make_shared<std::string>();
    link_cmd->add_option("path", *link_path, "Root-relative path")->required();
    link_cmd->callback([&ctx, link_path]() {
        ctx.prepare();
        auto files = make_accessor(ctx);
        if (!files.is_symlink(*link_path, ctx.root)) {
            std::cout << "false\n";
            return;
        }
        auto target = files.read_symlink_target(*link_path, ctx.root);
        std::cout << "true";
        if (target) std::cout << " -> " << *target;
        std::cout << "\n";
    });
}

// ---------------------------------------------------------------------------
// read
// ---------------------------------------------------------------------------

void register_read_command(CLI::App& app, CliContext& ctx) {
    auto* sub = app.add_subcommand("read", "Print the content of an allowed file");

    struct Options {
        std::string path;
        bool as_json = false;
    };
    auto opts = std::make_shared<Options>();
    sub->add_option("path", opts->path, "Root-relative path")->required();
    sub->add_flag("--json", opts->as_json, "Parse as JSON and pretty-print");

    sub->callback([&ctx, opts]() {
        ctx.prepare();
        auto files = make_accessor(ctx);

        if (opts->as_json) {
            auto doc = files.read_json(opts->path, ctx.root);
            if (!doc) {
                ctx.exit_code = report_error(doc.error());
                return;
            }
            std::cout << doc->dump(2) << "\n";
            return;
        }

        auto text = files.read_text(opts->path, ctx.root);
        if (!text) {
            ctx.exit_code = report_error(text.error());
            return;
        }
        std::cout << *text;
    });
}

// ---------------------------------------------------------------------------
// count / find
// ---------------------------------------------------------------------------

void register_walk_commands(CLI::App& app, CliContext& ctx) {
    struct Options {
        std::string dir;
        std::string pattern;
    };

    auto* count_cmd = app.add_subcommand("count", "Count files matching a glob under a directory");
    auto count_opts = std::make_shared<Options>();
    count_cmd->add_option("dir", count_opts->dir, "Root-relative directory")->required();
    count_cmd->add_option("pattern", count_opts->pattern, "Filename glob, e.g. *.md")->required();
    count_cmd->callback([&ctx, count_opts]() {
        ctx.prepare();
        auto files = make_accessor(ctx);
        auto count = files.count_files(count_opts->dir, count_opts->pattern, ctx.root);
        if (!count) {
            ctx.exit_code = report_error(count.error());
            return;
        }
        std::cout << *count << "\n";
    });

    auto* find_cmd = app.add_subcommand("find", "List files matching a glob under a directory");
    auto find_opts = std::make_shared<Options>();
    find_cmd->add_option("dir", find_opts->dir, "Root-relative directory")->required();
    find_cmd->add_option("pattern", find_opts->pattern, "Filename glob, e.g. *.md")->required();
    find_cmd->callback([&ctx, find_opts]() {
        ctx.prepare();
        auto files = make_accessor(ctx);
        auto found = files.find_files(find_opts->dir, find_opts->pattern, ctx.root);
        if (!found) {
            ctx.exit_code = report_error(found.error());
            return;
        }
        for (const auto& f : *found) {
            std::cout << f << "\n";
        }
    });
}

// ---------------------------------------------------------------------------
// validate
// ---------------------------------------------------------------------------

void register_validate_command(CLI::App& app, CliContext& ctx) {
    auto* sub = app.add_subcommand("validate", "Check the project's plugin structure");

    sub->callback([&ctx]() {
        ctx.prepare();
        auto files = make_accessor(ctx);
        plugin::PluginValidator validator(files, ctx.root, ctx.config.plugin);
        auto report = validator.run();

        for (const auto& msg : report.successes) std::cout << "ok:      " << msg << "\n";
        for (const auto& msg : report.warnings) std::cout << "warning: " << msg << "\n";
        for (const auto& msg : report.errors) std::cout << "error:   " << msg << "\n";

        std::cout << "\nSuccesses: " << report.successes.size()
                  << "  Warnings: " << report.warnings.size()
                  << "  Errors: " << report.errors.size() << "\n";

        if (!report.ok()) {
            ctx.exit_code = kExitFailure;
        }
    });
}

} // namespace docguard::cli
