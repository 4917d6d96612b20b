#pragma once
// include/voyage/weather/WeatherTypeRoller.hpp

#include "voyage/core/Rng.hpp"
#include "voyage/weather/WeatherTables.hpp"

namespace voyage::weather {

struct WeatherRoll {
    int         roll = 0;
    WeatherType type = WeatherType::Fair;
};

// One d100 against the season's weather table.
class WeatherTypeRoller {
public:
    explicit WeatherTypeRoller(const WeatherTables& tables) : m_tables(tables) {}

    [[nodiscard]] WeatherRoll roll(Season season, rng::RandomSource& rng) const
    {
        const int r = rng.d100();
        return {r, m_tables.weatherType(season, r)};
    }

private:
    const WeatherTables& m_tables;
};

} // namespace voyage::weather
