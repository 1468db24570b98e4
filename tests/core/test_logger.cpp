#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <thread>
#include <vector>

#include "docguard/core/logger.hpp"

TEST_CASE("Logger hands every thread the same loggers", "[logger]") {
    std::vector<spdlog::logger*> seen(8, nullptr);
    std::vector<spdlog::logger*> seen_audit(8, nullptr);

    std::vector<std::thread> workers;
    for (std::size_t t = 0; t < seen.size(); ++t) {
        workers.emplace_back([&seen, &seen_audit, t] {
            AUDIT_WARN("thread {} denial", t);
            seen[t] = docguard::Logger::get().get();
            seen_audit[t] = docguard::Logger::audit().get();
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    for (std::size_t t = 0; t < seen.size(); ++t) {
        CHECK(seen[t] != nullptr);
        CHECK(seen[t] == seen.front());
        CHECK(seen_audit[t] == seen_audit.front());
    }
}

TEST_CASE("Logger::init reconfigures the level", "[logger]") {
    docguard::Logger::init("docguard", "error");
    CHECK(docguard::Logger::get()->level() == spdlog::level::err);
    CHECK(docguard::Logger::audit()->level() == spdlog::level::warn);

    docguard::Logger::set_level("off");
    CHECK(docguard::Logger::audit()->level() == spdlog::level::off);

    docguard::Logger::init("docguard", "info");
}
