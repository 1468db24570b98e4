#include "docguard/plugin/validator.hpp"

#include "docguard/core/logger.hpp"

#include <optional>

namespace docguard::plugin {

namespace {

auto describe_failure(const Error& err) -> std::string {
    if (err.is_denial()) {
        return "access blocked (" + std::string(denial_reason_to_string(err.reason())) +
               "): " + err.what();
    }
    return err.what();
}

auto join(const std::vector<std::string>& items, std::string_view sep) -> std::string {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += sep;
        out += item;
    }
    return out;
}

auto has_field(const json& j, const char* key) -> bool {
    if (!j.contains(key)) return false;
    const auto& v = j.at(key);
    if (v.is_null()) return false;
    if (v.is_string()) return !v.get_ref<const std::string&>().empty();
    if (v.is_boolean()) return v.get<bool>();
    return true;
}

auto string_field(const json& j, const char* key) -> std::optional<std::string> {
    if (!j.is_object() || !j.contains(key) || !j.at(key).is_string()) {
        return std::nullopt;
    }
    return j.at(key).get<std::string>();
}

} // anonymous namespace

PluginValidator::PluginValidator(const infra::FileAccessor& files, std::string project_root,
                                 PluginExpectations expectations)
    : files_(files),
      root_(std::move(project_root)),
      expectations_(std::move(expectations)) {}

auto PluginValidator::run() -> ValidationReport {
    report_ = ValidationReport{};

    validate_package_json();
    validate_plugin_manifest();
    validate_marketplace_config();
    validate_symlinks();
    validate_commands();
    validate_agents();
    validate_documentation();

    LOG_INFO("Validation finished: {} successes, {} warnings, {} errors",
             report_.successes.size(), report_.warnings.size(), report_.errors.size());
    return report_;
}

auto PluginValidator::validate_package_json() -> bool {
    LOG_DEBUG("Validating package.json...");

    if (!files_.exists("package.json", root_)) {
        error("package.json not found");
        return false;
    }

    auto pkg = files_.read_json("package.json", root_);
    if (!pkg) {
        error("Failed to read package.json: " + describe_failure(pkg.error()));
        return false;
    }

    try {
        std::vector<std::string> missing;
        for (const auto* field : {"name", "version"}) {
            if (!has_field(*pkg, field)) missing.emplace_back(field);
        }
        if (!missing.empty()) {
            error("package.json missing required fields: " + join(missing, ", "));
            return false;
        }
    } catch (const json::exception& e) {
        error(std::string("Unexpected package.json structure: ") + e.what());
        return false;
    }

    success("package.json is valid");
    return true;
}

auto PluginValidator::validate_plugin_manifest() -> bool {
    LOG_DEBUG("Validating plugin manifest...");

    constexpr auto kManifest = ".claude-plugin/plugin.json";
    if (!files_.exists(kManifest, root_)) {
        error("Plugin manifest (.claude-plugin/plugin.json) not found");
        return false;
    }

    auto manifest = files_.read_json(kManifest, root_);
    if (!manifest) {
        error("Failed to read plugin manifest: " + describe_failure(manifest.error()));
        return false;
    }

    try {
        std::vector<std::string> missing;
        for (const auto* field : {"name", "version", "description", "author"}) {
            if (!has_field(*manifest, field)) missing.emplace_back(field);
        }
        if (!missing.empty()) {
            error("Plugin manifest missing required fields: " + join(missing, ", "));
            return false;
        }

        auto name = string_field(*manifest, "name").value_or(manifest->at("name").dump());
        if (name != expectations_.plugin_name) {
            warning("Plugin name is \"" + name + "\", expected \"" + expectations_.plugin_name + "\"");
        }
    } catch (const json::exception& e) {
        error(std::string("Unexpected plugin manifest structure: ") + e.what());
        return false;
    }

    success("Plugin manifest is valid");
    return true;
}

auto PluginValidator::validate_marketplace_config() -> bool {
    LOG_DEBUG("Validating marketplace configuration...");

    constexpr auto kMarketplace = ".claude-plugin/marketplace.json";
    if (!files_.exists(kMarketplace, root_)) {
        warning("Marketplace configuration (.claude-plugin/marketplace.json) not found - "
                "optional but recommended for testing");
        return true;
    }

    auto marketplace = files_.read_json(kMarketplace, root_);
    if (!marketplace) {
        error("Failed to read marketplace configuration: " +
              describe_failure(marketplace.error()));
        return false;
    }

    bool listed = false;
    try {
        if (!marketplace->is_object() || !marketplace->contains("plugins") ||
            !marketplace->at("plugins").is_array()) {
            error("Marketplace configuration missing plugins array");
            return false;
        }

        // Entries whose name is not a string simply do not match.
        for (const auto& entry : marketplace->at("plugins")) {
            if (string_field(entry, "name") == expectations_.plugin_name) {
                listed = true;
                break;
            }
        }
    } catch (const json::exception& e) {
        error(std::string("Unexpected marketplace configuration structure: ") + e.what());
        return false;
    }
    if (!listed) {
        error("Marketplace configuration does not include " + expectations_.plugin_name +
              " plugin");
        return false;
    }

    success("Marketplace configuration is valid");
    return true;
}

auto PluginValidator::validate_symlinks() -> bool {
    LOG_DEBUG("Validating directory symlinks...");

    bool commands_ok = validate_symlink("commands", ".claude/commands");
    bool agents_ok = validate_symlink("agents", ".claude/agents");
    return commands_ok && agents_ok;
}

auto PluginValidator::validate_symlink(std::string_view link, std::string_view expected_target)
    -> bool {
    auto name = std::string(link);

    // exists() follows the link, so a dangling link is reported as missing.
    if (!files_.exists(link, root_)) {
        error(name + "/ symlink not found at project root");
        return false;
    }
    if (!files_.is_symlink(link, root_)) {
        error(name + "/ exists but is not a symlink");
        return false;
    }

    auto target = files_.read_symlink_target(link, root_).value_or("");
    auto expected = std::string(expected_target);
    if (target != expected && target != expected + "/") {
        warning(name + "/ points to " + target + ", expected " + expected + "/");
    }

    success(name + "/ symlink is valid");
    return true;
}

auto PluginValidator::validate_commands() -> bool {
    LOG_DEBUG("Validating commands structure...");

    auto count = files_.count_files(".claude/commands", "*.md", root_);
    if (!count) {
        error("Failed to scan .claude/commands/: " + describe_failure(count.error()));
        return false;
    }
    if (*count == 0) {
        error("No command files found in .claude/commands/");
        return false;
    }

    success("Found " + std::to_string(*count) + " command files in .claude/commands/");

    bool all_phases = true;
    for (const auto& phase : expectations_.command_phases) {
        if (!files_.exists(".claude/commands/" + phase, root_)) {
            warning("Phase directory not found: " + phase);
            all_phases = false;
        }
    }
    if (all_phases && !expectations_.command_phases.empty()) {
        success("All " + std::to_string(expectations_.command_phases.size()) +
                " phase directories are present");
    }

    return true;
}

auto PluginValidator::validate_agents() -> bool {
    LOG_DEBUG("Validating agents structure...");

    auto count = files_.count_files(".claude/agents", "*.md", root_);
    if (!count) {
        error("Failed to scan .claude/agents/: " + describe_failure(count.error()));
        return false;
    }
    if (*count == 0) {
        // Agents are optional.
        warning("No agent files found in .claude/agents/");
        return true;
    }

    success("Found " + std::to_string(*count) + " agent files in .claude/agents/");
    return true;
}

auto PluginValidator::validate_documentation() -> bool {
    LOG_DEBUG("Validating documentation...");

    struct RequiredDoc {
        const char* file;
        const char* desc;
        bool mandatory;
    };
    static constexpr RequiredDoc kDocs[] = {
        {"README.md", "Main README", true},
        {"PLUGIN.md", "Plugin installation guide", false},
        {"CLAUDE.md", "Claude Code configuration", false},
    };

    bool ok = true;
    for (const auto& doc : kDocs) {
        auto label = std::string(doc.desc) + " (" + doc.file + ")";
        if (files_.exists(doc.file, root_)) {
            success(label + " found");
        } else if (doc.mandatory) {
            error(label + " not found");
            ok = false;
        } else {
            warning(label + " not found");
        }
    }
    return ok;
}

void PluginValidator::error(std::string message) {
    LOG_DEBUG("error: {}", message);
    report_.errors.push_back(std::move(message));
}

void PluginValidator::warning(std::string message) {
    LOG_DEBUG("warning: {}", message);
    report_.warnings.push_back(std::move(message));
}

void PluginValidator::success(std::string message) {
    LOG_DEBUG("ok: {}", message);
    report_.successes.push_back(std::move(message));
}

} // namespace docguard::plugin
