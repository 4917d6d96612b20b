#pragma once
// include/voyage/weather/WindGenerator.hpp
//
// Four wind readings per day (dawn, midday, dusk, midnight). Each period rolls
// a d10; on a 1 the wind changes one step stronger or lighter (coin flip) and
// a second coin flip decides whether the direction is re-rolled. Otherwise the
// previous reading carries forward. Dawn carries from the previous day's
// midnight; on the first day of a journey it is rolled fresh instead.

#include "voyage/core/Rng.hpp"
#include "voyage/weather/WeatherTables.hpp"

#include <array>
#include <optional>

namespace voyage::weather {

struct WindState {
    WindStrength  strength  = WindStrength::Calm;
    WindDirection direction = WindDirection::Sidewind;

    friend bool operator==(const WindState&, const WindState&) = default;
};

struct WindReading {
    TimeOfDay     period          = TimeOfDay::Dawn;
    WindStrength  strength        = WindStrength::Calm;
    WindDirection direction       = WindDirection::Sidewind;
    int           speedPct        = 0;
    int           handlingPenalty = 0;
    bool          requiresTacking = false;
    bool          changed         = false;

    [[nodiscard]] WindState state() const noexcept { return {strength, direction}; }

    friend bool operator==(const WindReading&, const WindReading&) = default;
};

using WindTimeline = std::array<WindReading, kPeriodsPerDay>;

class WindGenerator {
public:
    explicit WindGenerator(const WeatherTables& tables) : m_tables(tables) {}

    // `previous` is the last reading of the previous day, or nullopt on day 1.
    [[nodiscard]] WindTimeline generateDay(const std::optional<WindState>& previous,
                                           rng::RandomSource& rng) const;

    // One change check against `current`. Returns the new state and sets
    // `changed` when the d10 came up 1.
    [[nodiscard]] static WindState step(const WindState& current, rng::RandomSource& rng, bool& changed);

private:
    WindReading annotate(TimeOfDay period, const WindState& s, bool changed) const;

    const WeatherTables& m_tables;
};

// Strength seen in the most periods; ties go to the strongest.
[[nodiscard]] WindStrength MostCommonStrength(const WindTimeline& timeline) noexcept;

} // namespace voyage::weather
