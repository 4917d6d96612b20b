#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace voyage::core {

// Settings for the voyage_weather tool, stored as <dir>/voyage.ini.
struct Config {
    std::string   dataDir     = "data";      // journey documents live in <dataDir>/journeys
    std::string   logDir      = "logs";
    std::string   logLevel    = "info";
    int           stageDays   = 3;           // default stage length for new journeys, 1..10
    std::string   displayMode = "simple";    // simple | detailed
    std::uint64_t seed        = 0;           // 0 = seed from the clock
};

bool LoadConfig(Config& cfg, const std::filesystem::path& configDir);
bool SaveConfig(const Config& cfg, const std::filesystem::path& configDir);

} // namespace voyage::core
