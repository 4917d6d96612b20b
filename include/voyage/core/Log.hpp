#pragma once
#include <filesystem>
#include <memory>
#include <string_view>
#include <spdlog/spdlog.h>

namespace voyage::logsys {
    // Console + rotating file (<logDir>/voyage.log, 1MB * 4). Safe to call again
    // to move the log somewhere else; the previous logger is replaced.
    void init(const std::filesystem::path& logDir, spdlog::level::level_enum level = spdlog::level::info);

    // Console only. Used by tools and tests that never call init().
    void init_console(spdlog::level::level_enum level = spdlog::level::info);

    std::shared_ptr<spdlog::logger> get();  // "voyage"

    // "trace", "debug", "info", "warn", "error", "critical", "off"; unknown -> info
    spdlog::level::level_enum parse_level(std::string_view name);
}
