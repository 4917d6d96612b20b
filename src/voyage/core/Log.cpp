#include "voyage/core/Log.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace {
    std::mutex g_mutex;
    std::shared_ptr<spdlog::logger> g_logger;

    constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e][%l] %v";

    void install(std::shared_ptr<spdlog::logger> logger, spdlog::level::level_enum level) {
        logger->set_level(level);
        logger->set_pattern(kPattern);
        logger->flush_on(spdlog::level::warn);
        g_logger = logger;
        spdlog::set_default_logger(std::move(logger));
    }
}

void voyage::logsys::init(const fs::path& logDir, spdlog::level::level_enum level) {
    std::lock_guard<std::mutex> lock(g_mutex);

    std::error_code ec;
    fs::create_directories(logDir, ec);

    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    std::vector<spdlog::sink_ptr> sinks{console};
    if (!ec) {
        auto file = (logDir / "voyage.log").string();
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, 1 << 20, 4));
    }

    install(std::make_shared<spdlog::logger>("voyage", sinks.begin(), sinks.end()), level);
    if (ec)
        g_logger->warn("Log directory {} unavailable ({}); logging to console only", logDir.string(), ec.message());
    else
        g_logger->debug("Logging started in {}", logDir.string());
}

void voyage::logsys::init_console(spdlog::level::level_enum level) {
    std::lock_guard<std::mutex> lock(g_mutex);
    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    install(std::make_shared<spdlog::logger>("voyage", std::move(console)), level);
}

std::shared_ptr<spdlog::logger> voyage::logsys::get() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_logger) {
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto logger = std::make_shared<spdlog::logger>("voyage", std::move(console));
        logger->set_pattern(kPattern);
        logger->set_level(spdlog::level::warn);
        g_logger = std::move(logger);
    }
    return g_logger;
}

spdlog::level::level_enum voyage::logsys::parse_level(std::string_view name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    return spdlog::level::info;
}
