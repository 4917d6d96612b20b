#pragma once
// include/voyage/journey/StageOrchestrator.hpp
//
// Runs the daily generators in order (wind, weather type, temperature) and
// threads each day's outgoing event and cooldown state into the next day.
//
// Each generated day is committed on its own: the record and the journey
// state advanced past it go to the store in one commitDay call. A
// StorageError on day k of a stage leaves days 1..k-1 committed and the
// stage counter untouched; the caller can re-request the remaining days from
// the stored state.

#include "voyage/core/Rng.hpp"
#include "voyage/journey/Journey.hpp"
#include "voyage/journey/JourneyStore.hpp"
#include "voyage/weather/TemperatureEvents.hpp"
#include "voyage/weather/WeatherTypeRoller.hpp"
#include "voyage/weather/WindGenerator.hpp"

#include <optional>
#include <string>
#include <vector>

namespace voyage::journey {

struct DayOutcome {
    DailyWeatherRecord record;
    JourneyState       next;
};

// Pure day step: no store, no side effects beyond the random source.
class DayGenerator {
public:
    explicit DayGenerator(const weather::WeatherTables& tables);

    // Generates `state.currentDay` for the given region/season. The returned
    // state has the day counter, event, cooldowns and wind advanced; stage,
    // region and season are copied through unchanged.
    [[nodiscard]] DayOutcome generate(const JourneyState& state,
                                      weather::Region region,
                                      weather::Season season,
                                      rng::RandomSource& rng) const;

private:
    const weather::WeatherTables&   m_tables;
    weather::WindGenerator          m_wind;
    weather::WeatherTypeRoller      m_weather;
    weather::TemperatureEventEngine m_temperature;
};

class StageOrchestrator {
public:
    StageOrchestrator(JourneyStore& store, const weather::WeatherTables& tables, rng::RandomSource& rng);

    // One day with the journey's own region and season.
    DailyWeatherRecord generateDay(const std::string& key);

    // `days` defaults to the journey's stage duration and must lie in
    // [kMinStageDays, kMaxStageDays]. The stage counter advances only after
    // every day has been committed.
    std::vector<DailyWeatherRecord> generateStage(const std::string& key, std::optional<int> days = std::nullopt);

    // Generates `day` with an explicit region and season; the journey's
    // stored region and season are left as they are. `day` lies in
    // [1, currentDay]: the next day is committed like generateDay, an earlier
    // day is re-rolled from the state its predecessor handed on and replaces
    // the stored record. Re-rolling the last generated day also replaces the
    // carried event, cooldowns and wind; later records are not touched.
    DailyWeatherRecord overrideDay(const std::string& key, int day,
                                   weather::Region region, weather::Season season);

    // Pure read. Empty when that day has not been generated.
    [[nodiscard]] std::optional<DailyWeatherRecord> viewDay(const std::string& key, int day);

    // The same stage run over an in-memory state: `state` is advanced by
    // `days` days and one stage, nothing is stored.
    [[nodiscard]] std::vector<DailyWeatherRecord> simulate(JourneyState& state, int days);

private:
    JourneyState       requireJourney(const std::string& key);
    JourneyState       stateBefore(const std::string& key, const JourneyState& journey, int day);
    void               store(const std::string& key, const DailyWeatherRecord& record, const JourneyState* state);
    DailyWeatherRecord commitDay(const std::string& key, JourneyState& state,
                                 weather::Region region, weather::Season season, bool overridden);

    JourneyStore&      m_store;
    DayGenerator       m_days;
    rng::RandomSource& m_rng;
};

} // namespace voyage::journey
