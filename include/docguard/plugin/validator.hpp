#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "docguard/core/config.hpp"
#include "docguard/infra/file_accessor.hpp"

namespace docguard::plugin {

/// Outcome of a structure validation run.
struct ValidationReport {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::vector<std::string> successes;

    [[nodiscard]] auto ok() const noexcept -> bool { return errors.empty(); }
};

/// Checks that a project is laid out as a distributable plugin.
///
/// Every filesystem access goes through the supplied FileAccessor, so the
/// validator can only see what the allow-list permits.
class PluginValidator {
public:
    PluginValidator(const infra::FileAccessor& files, std::string project_root,
                    PluginExpectations expectations = {});

    /// Runs every check in order and returns the collected report.
    auto run() -> ValidationReport;

    auto validate_package_json() -> bool;
    auto validate_plugin_manifest() -> bool;
    auto validate_marketplace_config() -> bool;
    auto validate_symlinks() -> bool;
    auto validate_commands() -> bool;
    auto validate_agents() -> bool;
    auto validate_documentation() -> bool;

    [[nodiscard]] auto report() const noexcept -> const ValidationReport& { return report_; }

private:
    void error(std::string message);
    void warning(std::string message);
    void success(std::string message);

    auto validate_symlink(std::string_view link, std::string_view expected_target) -> bool;

    const infra::FileAccessor& files_;
    std::string root_;
    PluginExpectations expectations_;
    ValidationReport report_;
};

} // namespace docguard::plugin
