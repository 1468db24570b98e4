#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace docguard {

class Logger {
public:
    static void init(std::string_view name = "docguard", std::string_view level = "info");
    static auto get() -> std::shared_ptr<spdlog::logger>&;

    /// Separate channel for security denials so they can be routed and
    /// filtered apart from ordinary not-found noise.
    static auto audit() -> std::shared_ptr<spdlog::logger>&;

    static void set_level(std::string_view level);
    static void flush();
};

} // namespace docguard

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::docguard::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::docguard::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(::docguard::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(::docguard::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::docguard::Logger::get(), __VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_LOGGER_CRITICAL(::docguard::Logger::get(), __VA_ARGS__)

#define AUDIT_WARN(...) SPDLOG_LOGGER_WARN(::docguard::Logger::audit(), __VA_ARGS__)
