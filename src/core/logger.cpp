#include "docguard/core/logger.hpp"

#include <algorithm>
#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace docguard {

namespace {
    std::shared_ptr<spdlog::logger> g_logger;
    std::shared_ptr<spdlog::logger> g_audit;

    std::once_flag g_default_once;
    std::mutex g_init_mutex;

    constexpr auto kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v";

    auto parse_level(std::string_view level) -> spdlog::level::level_enum {
        if (level == "trace") return spdlog::level::trace;
        if (level == "debug") return spdlog::level::debug;
        if (level == "warn") return spdlog::level::warn;
        if (level == "error") return spdlog::level::err;
        if (level == "critical") return spdlog::level::critical;
        if (level == "off") return spdlog::level::off;
        return spdlog::level::info;
    }

    void apply_level(spdlog::level::level_enum lvl) {
        g_logger->set_level(lvl);
        // Denials stay visible unless logging is switched off entirely.
        g_audit->set_level(lvl == spdlog::level::off ? lvl : std::min(lvl, spdlog::level::warn));
    }

    // Caller holds g_init_mutex.
    void create_loggers(std::string_view name, std::string_view level) {
        auto main_name = std::string(name);
        auto audit_name = main_name + ".audit";

        // Re-initialization replaces the registered loggers instead of throwing.
        spdlog::drop(main_name);
        spdlog::drop(audit_name);

        g_logger = spdlog::stdout_color_mt(main_name);
        g_logger->set_pattern(kPattern);

        g_audit = spdlog::stderr_color_mt(audit_name);
        g_audit->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [audit] [%^%l%$] %v");

        apply_level(parse_level(level));
    }

    void ensure_default_loggers() {
        std::call_once(g_default_once, [] {
            std::lock_guard lock(g_init_mutex);
            if (!g_logger) {
                create_loggers("docguard", "info");
            }
        });
    }
}

// Reconfiguration; call before worker threads start logging.
void Logger::init(std::string_view name, std::string_view level) {
    std::lock_guard lock(g_init_mutex);
    create_loggers(name, level);
}

auto Logger::get() -> std::shared_ptr<spdlog::logger>& {
    ensure_default_loggers();
    return g_logger;
}

auto Logger::audit() -> std::shared_ptr<spdlog::logger>& {
    ensure_default_loggers();
    return g_audit;
}

void Logger::set_level(std::string_view level) {
    ensure_default_loggers();
    std::lock_guard lock(g_init_mutex);
    apply_level(parse_level(level));
}

void Logger::flush() {
    if (g_logger) g_logger->flush();
    if (g_audit) g_audit->flush();
}

} // namespace docguard
