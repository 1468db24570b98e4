#include "docguard/core/config.hpp"
#include "docguard/core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string_view>

namespace docguard {

namespace {

auto parse_size(const char* name, const char* value, std::size_t fallback) -> std::size_t {
    // stoull accepts a sign and wraps negatives, so only plain digits get through.
    std::string_view digits(value);
    if (digits.empty() || !std::ranges::all_of(digits, [](unsigned char c) {
            return std::isdigit(c) != 0;
        })) {
        LOG_WARN("Ignoring invalid {}='{}', keeping {}", name, value, fallback);
        return fallback;
    }

    try {
        auto parsed = std::stoull(value);
        if (parsed == 0) {
            LOG_WARN("Ignoring {}=0, keeping {}", name, fallback);
            return fallback;
        }
        return static_cast<std::size_t>(parsed);
    } catch (const std::exception& e) {
        LOG_WARN("Ignoring invalid {}='{}': {}", name, value, e.what());
        return fallback;
    }
}

/// True when every walk limit present in `limits` is a non-negative integer.
auto limits_are_unsigned(const json& j) -> bool {
    if (!j.contains("limits") || !j["limits"].is_object()) {
        return true;
    }
    const auto& limits = j["limits"];
    for (const auto* key : {"max_depth", "max_entries", "max_pattern_length"}) {
        if (limits.contains(key) && !limits[key].is_number_unsigned()) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

auto load_config(const std::filesystem::path& path) -> Config {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);

        if (j.contains("allow_list") || j.contains("documented_dirs") ||
            j.contains("allowed_root_files")) {
            LOG_WARN("Config: ignoring access policy keys in {}; the allow-list is not configurable",
                     path.string());
        }

        if (!limits_are_unsigned(j)) {
            LOG_WARN("Config: walk limits must be non-negative integers, using default limits");
            j["limits"].erase("max_depth");
            j["limits"].erase("max_entries");
            j["limits"].erase("max_pattern_length");
        }

        auto config = j.get<Config>();
        if (config.limits.max_depth == 0 || config.limits.max_entries == 0 ||
            config.limits.max_pattern_length == 0) {
            LOG_WARN("Config: zero walk limits are invalid, using default limits");
            config.limits = AccessLimits{};
        }
        return config;
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

auto load_config_from_env() -> Config {
    Config config;

    if (auto* val = std::getenv("DOCGUARD_LOG_LEVEL")) {
        config.log_level = val;
    }
    if (auto* val = std::getenv("DOCGUARD_MAX_DEPTH")) {
        config.limits.max_depth = parse_size("DOCGUARD_MAX_DEPTH", val, config.limits.max_depth);
    }
    if (auto* val = std::getenv("DOCGUARD_MAX_ENTRIES")) {
        config.limits.max_entries = parse_size("DOCGUARD_MAX_ENTRIES", val, config.limits.max_entries);
    }

    return config;
}

auto default_config() -> Config {
    return Config{};
}

} // namespace docguard
