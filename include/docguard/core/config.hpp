#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace docguard {

using json = nlohmann::json;

/// Bounds applied by FileAccessor to recursive walks and glob patterns.
struct AccessLimits {
    std::size_t max_depth = 32;
    std::size_t max_entries = 100000;
    std::size_t max_pattern_length = 256;
    std::vector<std::string> exclude_dirs = {"node_modules", ".git"};
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(AccessLimits, max_depth, max_entries, max_pattern_length, exclude_dirs)

/// What the plugin structure validator expects to find.
struct PluginExpectations {
    std::string plugin_name = "ccprompts";
    std::vector<std::string> command_phases = {
        "00-initial-workflow",
        "01-project-setup",
        "02-development",
        "03-security",
        "04-testing",
        "05-deployment",
        "06-collaboration",
        "07-utilities",
        "08-extras",
        "09-agentic-capabilities",
        "10-ai-native-development",
        "11-enterprise-scale",
    };
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(PluginExpectations, plugin_name, command_phases)

// The allow-list is intentionally not part of Config: authorization policy
// is fixed at build time and cannot be widened from a file or the environment.
struct Config {
    std::string log_level = "info";
    AccessLimits limits;
    PluginExpectations plugin;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, log_level, limits, plugin)

auto load_config(const std::filesystem::path& path) -> Config;
auto load_config_from_env() -> Config;
auto default_config() -> Config;

} // namespace docguard
