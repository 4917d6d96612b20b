#pragma once
// include/voyage/journey/Journey.hpp
//
// Per-party journey state and the immutable record written for each day.

#include "voyage/weather/TemperatureEvents.hpp"
#include "voyage/weather/WindGenerator.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace voyage::journey {

inline constexpr int kMinStageDays     = 1;
inline constexpr int kMaxStageDays     = 10;
inline constexpr int kDefaultStageDays = 3;

enum class DisplayMode : std::uint8_t {
    Simple = 0,
    Detailed,
};

[[nodiscard]] const char* ToKey(DisplayMode m) noexcept;
// "simple" | "detailed"; anything else throws ConfigurationError.
[[nodiscard]] DisplayMode ParseDisplayMode(std::string_view text);

// Throws ConfigurationError outside [kMinStageDays, kMaxStageDays].
void ValidateStageDuration(int days);

struct JourneyState {
    int                 currentDay    = 1;   // next day to generate
    int                 currentStage  = 1;
    int                 stageDuration = kDefaultStageDays;
    DisplayMode         displayMode   = DisplayMode::Simple;
    weather::Region     region        = weather::Region::Reikland;
    weather::Season     season        = weather::Season::Spring;
    weather::EventState event;                              // carried into currentDay
    weather::Cooldowns  cooldowns;                          // carried into currentDay
    std::optional<weather::WindState> lastWind;             // midnight of the last generated day
    std::string         startedUtc;

    [[nodiscard]] int lastGeneratedDay() const noexcept { return currentDay - 1; }

    friend bool operator==(const JourneyState&, const JourneyState&) = default;
};

struct DailyWeatherRecord {
    int                          day    = 1;
    weather::Region              region = weather::Region::Reikland;
    weather::Season              season = weather::Season::Spring;
    weather::WindTimeline        wind{};
    weather::WindStrength        mostCommonWind    = weather::WindStrength::Calm;
    int                          weatherRoll       = 0;
    weather::WeatherType         weather           = weather::WeatherType::Fair;
    int                          temperatureRoll   = 0;
    int                          baseTemperature   = 0;
    int                          actualTemperature = 0;
    int                          perceivedTemperature = 0;
    weather::TemperatureCategory category = weather::TemperatureCategory::Average;
    std::string                  description;
    weather::EventState          event;       // outgoing
    weather::Cooldowns           cooldowns;   // outgoing
    bool                         overridden = false;

    friend bool operator==(const DailyWeatherRecord&, const DailyWeatherRecord&) = default;
};

} // namespace voyage::journey
