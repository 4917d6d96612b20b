#pragma once
// include/voyage/weather/WeatherTables.hpp
//
// Read-only lookup tables for river weather: province base temperatures, the
// seasonal d100 weather tables, the d100 temperature variation table and the
// wind modifier grid. A WeatherTables instance is validated once at
// construction (every d100 table must cover 1..100 without gaps or overlaps)
// and is immutable afterwards, so one instance can be shared by every journey.

#include "voyage/weather/WeatherTypes.hpp"

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace voyage::weather {

inline constexpr int kD100Min = 1;
inline constexpr int kD100Max = 100;

[[nodiscard]] constexpr bool IsD100(int roll) noexcept
{
    return roll >= kD100Min && roll <= kD100Max;
}

// d10 tables: 1-2 calm, 3-4 light, 5-6 bracing, 7-8 strong, 9-10 very strong.
[[nodiscard]] WindStrength  WindStrengthFromD10(int roll) noexcept;
// 1-3 tailwind, 4-7 sidewind, 8-10 headwind.
[[nodiscard]] WindDirection WindDirectionFromD10(int roll) noexcept;

struct WindModifiers {
    int         speedPct        = 0;     // +/- percent of normal river speed
    int         handlingPenalty = 0;     // applied to Boat Handling Tests (0 or negative)
    bool        requiresTacking = false; // the speed bonus is only reachable by tacking
    std::string notes;
};

struct WeatherRange {
    int         lo = 0;
    int         hi = 0;
    WeatherType type = WeatherType::Fair;
};

struct VariationRange {
    int             lo     = 0;
    int             hi     = 0;
    VariationBucket bucket = VariationBucket::Average;
    int             delta  = 0;   // degrees added to the base temperature
};

struct TemperatureVariation {
    VariationBucket bucket = VariationBucket::Average;
    int             delta  = 0;
};

struct WeatherEffects {
    std::string              name;
    std::string              description;
    std::vector<std::string> effects;
};

// Raw table contents. DefaultData() returns the river-travel tables; tests
// build broken variants to exercise validation.
struct WeatherTableData {
    std::array<std::array<int, kSeasonCount>, kRegionCount>                      baseTemperature{};
    std::array<std::vector<WeatherRange>, kSeasonCount>                          weather;
    std::vector<VariationRange>                                                  variation;
    std::array<std::array<WindModifiers, kWindDirectionCount>, kWindStrengthCount> wind;
    std::array<WeatherEffects, kWeatherTypeCount>                                effects;
};

class WeatherTables {
public:
    // Throws ConfigurationError when a d100 table has a gap or an overlap.
    explicit WeatherTables(WeatherTableData data);

    [[nodiscard]] static WeatherTableData     DefaultData();
    [[nodiscard]] static const WeatherTables& Default();

    // Enum values outside the declared range are a ConfigurationError.
    void                               validate(Region region, Season season) const;
    [[nodiscard]] int                  baseTemperature(Region region, Season season) const;
    [[nodiscard]] WeatherType          weatherType(Season season, int roll) const;
    [[nodiscard]] const WindModifiers& windModifiers(WindStrength strength, WindDirection direction) const;
    [[nodiscard]] TemperatureVariation temperatureVariation(int roll) const;
    [[nodiscard]] const WeatherEffects& effects(WeatherType type) const;

    // Text keys, parsed the same way as the command line does.
    [[nodiscard]] int baseTemperature(std::string_view region, std::string_view season) const;

private:
    WeatherTableData m_data;
};

// Category from the difference between the final temperature and the
// seasonal base (thresholds -15/-10/-6/-3/2/5/9/14).
[[nodiscard]] TemperatureCategory CategorizeTemperature(int diffFromBase) noexcept;

[[nodiscard]] std::string_view CategoryDescription(TemperatureCategory category) noexcept;

// Felt temperature relative to the seasonal average ("Slightly cool", ...).
[[nodiscard]] std::string_view RelativeFeel(int diffFromBase) noexcept;

// Degrees the wind takes off the felt temperature: light/bracing -5,
// strong/very strong -10, calm 0.
[[nodiscard]] int WindChill(WindStrength strength) noexcept;

[[nodiscard]] inline int PerceivedTemperature(int actual, WindStrength strength) noexcept
{
    return actual + WindChill(strength);
}

} // namespace voyage::weather
