#pragma once
// include/voyage/app/WeatherFormat.hpp
//
// Plain-text rendering of days and journey status for the terminal.

#include "voyage/journey/Journey.hpp"
#include "voyage/journey/JourneyService.hpp"
#include "voyage/weather/WeatherTables.hpp"

#include <string>
#include <vector>

namespace voyage::app {

// Simple: one block per day with the headline figures.
// Detailed: adds the wind timeline with modifiers and the weather effects.
[[nodiscard]] std::string FormatDay(const journey::DailyWeatherRecord& day,
                                    journey::DisplayMode mode,
                                    const weather::WeatherTables& tables);

[[nodiscard]] std::string FormatStage(int stage,
                                      const std::vector<journey::DailyWeatherRecord>& days,
                                      journey::DisplayMode mode,
                                      const weather::WeatherTables& tables);

[[nodiscard]] std::string FormatStatus(const std::string& key,
                                       const journey::JourneyState& state,
                                       const journey::CooldownStatus& cooldowns);

// "+20%", "-5%", "0%"
[[nodiscard]] std::string FormatPercent(int pct);

} // namespace voyage::app
