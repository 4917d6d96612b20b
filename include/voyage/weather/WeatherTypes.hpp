#pragma once
// include/voyage/weather/WeatherTypes.hpp
//
// Strong enumerations for everything the weather tables are keyed by, plus
// their snake_case text keys (used in journey documents and on the command line).
// Parsing an unknown key throws voyage::ConfigurationError.

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace voyage::weather {

enum class Season : std::uint8_t {
    Spring = 0,
    Summer,
    Autumn,
    Winter,
};
inline constexpr std::size_t kSeasonCount = 4;

enum class Region : std::uint8_t {
    Reikland = 0,
    Nordland,
    Ostland,
    Middenland,
    Hochland,
    Talabecland,
    Ostermark,
    Stirland,
    Sylvania,
    Wissenland,
    Averland,
    Solland,
    Kislev,
    Wasteland,
    BorderPrinces,
};
inline constexpr std::size_t kRegionCount = 15;

// Ordered weakest to strongest; WindGenerator steps along this order.
enum class WindStrength : std::uint8_t {
    Calm = 0,
    Light,
    Bracing,
    Strong,
    VeryStrong,
};
inline constexpr std::size_t kWindStrengthCount = 5;

// Relative to the boat's heading.
enum class WindDirection : std::uint8_t {
    Tailwind = 0,
    Sidewind,
    Headwind,
};
inline constexpr std::size_t kWindDirectionCount = 3;

enum class WeatherType : std::uint8_t {
    Dry = 0,
    Fair,
    Rain,
    Downpour,
    Snow,
    Blizzard,
};
inline constexpr std::size_t kWeatherTypeCount = 6;

// Rows of the d100 temperature variation table.
enum class VariationBucket : std::uint8_t {
    ExtremelyLow = 0,
    ColdFront,
    VeryLow,
    Low,
    Average,
    High,
    VeryHigh,
    HeatWave,
    ExtremelyHigh,
};

// Displayed category, always derived from the final temperature.
enum class TemperatureCategory : std::uint8_t {
    ExtremelyLow = 0,
    VeryLow,
    Low,
    Cool,
    Average,
    Warm,
    High,
    VeryHigh,
    ExtremelyHigh,
};

enum class TimeOfDay : std::uint8_t {
    Dawn = 0,
    Midday,
    Dusk,
    Midnight,
};
inline constexpr std::size_t kPeriodsPerDay = 4;

[[nodiscard]] const char* ToKey(Season s) noexcept;
[[nodiscard]] const char* ToKey(Region r) noexcept;
[[nodiscard]] const char* ToKey(WindStrength s) noexcept;
[[nodiscard]] const char* ToKey(WindDirection d) noexcept;
[[nodiscard]] const char* ToKey(WeatherType w) noexcept;
[[nodiscard]] const char* ToKey(VariationBucket b) noexcept;
[[nodiscard]] const char* ToKey(TemperatureCategory c) noexcept;
[[nodiscard]] const char* ToKey(TimeOfDay t) noexcept;

// Human-readable names ("Border Princes", "Very Strong", "Midnight").
[[nodiscard]] std::string DisplayName(Season s);
[[nodiscard]] std::string DisplayName(Region r);
[[nodiscard]] std::string DisplayName(WindStrength s);
[[nodiscard]] std::string DisplayName(WindDirection d);
[[nodiscard]] std::string DisplayName(TimeOfDay t);

// Case-insensitive; spaces and hyphens are treated as underscores.
[[nodiscard]] Season              ParseSeason(std::string_view text);
[[nodiscard]] Region              ParseRegion(std::string_view text);
[[nodiscard]] WindStrength        ParseWindStrength(std::string_view text);
[[nodiscard]] WindDirection       ParseWindDirection(std::string_view text);
[[nodiscard]] WeatherType         ParseWeatherType(std::string_view text);
[[nodiscard]] TemperatureCategory ParseTemperatureCategory(std::string_view text);
[[nodiscard]] TimeOfDay           ParseTimeOfDay(std::string_view text);

} // namespace voyage::weather
