#pragma once
// include/voyage/weather/TemperatureEvents.hpp
//
// Daily temperature with multi-day cold fronts and heat waves.
//
// resolve() is a pure step: (region, season, d100 roll, yesterday's EventState
// and cooldowns) -> (temperature, category, description, tomorrow's EventState
// and cooldowns). The only randomness it consumes itself is the duration draw
// when an event starts.
//
// Rules, in order:
//   - An event is active while its remaining count is > 0. Both active at once
//     is an InvariantViolation.
//   - Triggers are only looked at when no event is active: roll 2 starts a cold
//     front (1d5 days), roll 99 a heat wave (10+1d10 days), each only if its
//     cooldown counter is >= 7. Cold front is checked first.
//   - A new event is not decremented on its first day; a continuing one is.
//   - During an event the temperature is base +/-10 plus the table delta
//     clamped to +/-5. Otherwise base plus the table delta.
//   - The category is always taken from the final temperature.

#include "voyage/core/Rng.hpp"
#include "voyage/weather/CooldownTracker.hpp"
#include "voyage/weather/WeatherTables.hpp"

#include <string>

namespace voyage::weather {

inline constexpr int kColdFrontTriggerRoll  = 2;
inline constexpr int kHeatWaveTriggerRoll   = 99;
inline constexpr int kColdFrontMinDays      = 1;
inline constexpr int kColdFrontMaxDays      = 5;
inline constexpr int kHeatWaveBaseDays      = 10;
inline constexpr int kHeatWaveMinDays       = 11;
inline constexpr int kHeatWaveMaxDays       = 20;
inline constexpr int kColdFrontModifier     = -10;
inline constexpr int kHeatWaveModifier      = 10;
inline constexpr int kEventVariationLimit   = 5;

struct EventProgress {
    int remaining = 0;
    int total     = 0;

    [[nodiscard]] bool active() const noexcept { return remaining > 0; }

    friend bool operator==(const EventProgress&, const EventProgress&) = default;
};

struct EventState {
    EventProgress coldFront;
    EventProgress heatWave;

    [[nodiscard]] EventKind activeKind() const noexcept
    {
        if (coldFront.active()) return EventKind::ColdFront;
        if (heatWave.active())  return EventKind::HeatWave;
        return EventKind::None;
    }

    friend bool operator==(const EventState&, const EventState&) = default;
};

struct TemperatureInput {
    Region     region = Region::Reikland;
    Season     season = Season::Spring;
    int        roll   = 50;
    EventState previous;
    Cooldowns  cooldowns;
};

struct TemperatureResult {
    int                 roll              = 0;
    int                 baseTemperature   = 0;
    int                 actualTemperature = 0;
    VariationBucket     bucket            = VariationBucket::Average;
    TemperatureCategory category          = TemperatureCategory::Average;
    std::string         description;
    EventKind           started           = EventKind::None;  // event that began today
    EventKind           ended             = EventKind::None;  // event whose last day was today
    bool                suppressed        = false;            // trigger roll ignored during an event
    EventState          event;                                // carried into tomorrow
    Cooldowns           cooldowns;                            // carried into tomorrow
};

class TemperatureEventEngine {
public:
    explicit TemperatureEventEngine(const WeatherTables& tables) : m_tables(tables) {}

    // Throws ConfigurationError for an unknown region/season and
    // InvariantViolation for an impossible incoming state.
    [[nodiscard]] TemperatureResult resolve(const TemperatureInput& in, rng::RandomSource& rng) const;

    // Throws InvariantViolation unless `state` and `cooldowns` are something
    // resolve() could have produced.
    static void validate(const EventState& state, const Cooldowns& cooldowns);

private:
    const WeatherTables& m_tables;
};

// "Cold Front: Day 2 of 3", with the flavour and final-day suffixes.
[[nodiscard]] std::string EventProgressLine(EventKind kind, const EventProgress& outgoing);

} // namespace voyage::weather
