// src/voyage/journey/StageOrchestrator.cpp
#include "voyage/journey/StageOrchestrator.hpp"
#include "voyage/core/Errors.hpp"
#include "voyage/core/Log.hpp"

#include <string>

namespace voyage::journey {

using namespace voyage::weather;

// ---------- DayGenerator ----------

DayGenerator::DayGenerator(const WeatherTables& tables)
    : m_tables(tables)
    , m_wind(tables)
    , m_weather(tables)
    , m_temperature(tables)
{
}

DayOutcome DayGenerator::generate(const JourneyState& state, Region region, Season season,
                                  rng::RandomSource& rng) const
{
    // Fails before any dice are rolled when the inputs are bad.
    m_tables.validate(region, season);
    TemperatureEventEngine::validate(state.event, state.cooldowns);

    rng.beginDay(state.currentDay);

    DayOutcome out;
    DailyWeatherRecord& rec = out.record;
    rec.day    = state.currentDay;
    rec.region = region;
    rec.season = season;

    rec.wind           = m_wind.generateDay(state.lastWind, rng);
    rec.mostCommonWind = MostCommonStrength(rec.wind);

    const WeatherRoll w = m_weather.roll(season, rng);
    rec.weatherRoll = w.roll;
    rec.weather     = w.type;

    TemperatureInput in;
    in.region    = region;
    in.season    = season;
    in.roll      = rng.d100();
    in.previous  = state.event;
    in.cooldowns = state.cooldowns;
    const TemperatureResult t = m_temperature.resolve(in, rng);

    rec.temperatureRoll      = t.roll;
    rec.baseTemperature      = t.baseTemperature;
    rec.actualTemperature    = t.actualTemperature;
    rec.perceivedTemperature = PerceivedTemperature(t.actualTemperature, rec.mostCommonWind);
    rec.category             = t.category;
    rec.description          = t.description;
    rec.event                = t.event;
    rec.cooldowns            = t.cooldowns;

    out.next            = state;
    out.next.currentDay = state.currentDay + 1;
    out.next.event      = t.event;
    out.next.cooldowns  = t.cooldowns;
    out.next.lastWind   = rec.wind.back().state();
    return out;
}

// ---------- StageOrchestrator ----------

StageOrchestrator::StageOrchestrator(JourneyStore& store, const WeatherTables& tables, rng::RandomSource& rng)
    : m_store(store)
    , m_days(tables)
    , m_rng(rng)
{
}

JourneyState StageOrchestrator::requireJourney(const std::string& key)
{
    auto state = m_store.loadJourney(key);
    if (!state) throw JourneyNotFound(key);
    return *state;
}

// The input a stored day was generated from: the previous record's outgoing
// event, cooldowns and midnight wind, or a fresh journey's for day 1.
JourneyState StageOrchestrator::stateBefore(const std::string& key, const JourneyState& journey, int day)
{
    JourneyState in = journey;
    in.currentDay = day;
    in.event      = {};
    in.cooldowns  = {};
    in.lastWind.reset();
    if (day == 1) return in;

    const auto prev = m_store.loadDay(key, day - 1);
    if (!prev)
        throw StorageError("journey " + key + ": record for day " + std::to_string(day - 1) + " is missing");
    in.event     = prev->event;
    in.cooldowns = prev->cooldowns;
    in.lastWind  = prev->wind.back().state();
    return in;
}

// With `state` the record and the journey state are written together,
// otherwise only the record.
void StageOrchestrator::store(const std::string& key, const DailyWeatherRecord& record, const JourneyState* state)
{
    try {
        if (state)
            m_store.commitDay(key, record, *state);
        else
            m_store.saveDay(key, record);
    }
    catch (const StorageError& e) {
        logsys::get()->error("journey {}: day {} not committed: {}", key, record.day, e.what());
        throw;
    }
}

DailyWeatherRecord StageOrchestrator::commitDay(const std::string& key, JourneyState& state,
                                                Region region, Season season, bool overridden)
{
    DayOutcome day = m_days.generate(state, region, season, m_rng);
    day.record.overridden = overridden;

    store(key, day.record, &day.next);

    state = day.next;
    return day.record;
}

DailyWeatherRecord StageOrchestrator::generateDay(const std::string& key)
{
    JourneyState state = requireJourney(key);
    DailyWeatherRecord rec = commitDay(key, state, state.region, state.season, false);
    logsys::get()->debug("journey {}: day {} generated ({}, {} C)", key, rec.day,
                         ToKey(rec.weather), rec.actualTemperature);
    return rec;
}

std::vector<DailyWeatherRecord> StageOrchestrator::generateStage(const std::string& key, std::optional<int> days)
{
    JourneyState state = requireJourney(key);
    const int n = days.value_or(state.stageDuration);
    ValidateStageDuration(n);

    std::vector<DailyWeatherRecord> out;
    out.reserve(static_cast<std::size_t>(n));
    for (int i = 0; i < n; ++i)
        out.push_back(commitDay(key, state, state.region, state.season, false));

    state.currentStage += 1;
    try {
        m_store.saveJourney(key, state);
    }
    catch (const StorageError& e) {
        logsys::get()->error("journey {}: stage {} days committed but stage counter not advanced: {}",
                             key, state.currentStage - 1, e.what());
        throw;
    }

    logsys::get()->info("journey {}: stage {} complete, days {}-{}", key, state.currentStage - 1,
                        out.front().day, out.back().day);
    return out;
}

DailyWeatherRecord StageOrchestrator::overrideDay(const std::string& key, int day, Region region, Season season)
{
    JourneyState state = requireJourney(key);
    if (day < 1 || day > state.currentDay)
        throw ConfigurationError("day " + std::to_string(day) + " cannot be overridden; journey '" + key +
                                 "' accepts days 1-" + std::to_string(state.currentDay));

    if (day == state.currentDay)
    {
        DailyWeatherRecord rec = commitDay(key, state, region, season, true);
        logsys::get()->info("journey {}: day {} generated with override {}/{}", key, rec.day,
                            ToKey(region), ToKey(season));
        return rec;
    }

    DayOutcome out = m_days.generate(stateBefore(key, state, day), region, season, m_rng);
    out.record.overridden = true;

    if (day == state.lastGeneratedDay())
    {
        state.event     = out.next.event;
        state.cooldowns = out.next.cooldowns;
        state.lastWind  = out.next.lastWind;
        store(key, out.record, &state);
    }
    else
    {
        store(key, out.record, nullptr);
    }

    logsys::get()->info("journey {}: day {} regenerated with override {}/{}", key, day,
                        ToKey(region), ToKey(season));
    return out.record;
}

std::optional<DailyWeatherRecord> StageOrchestrator::viewDay(const std::string& key, int day)
{
    requireJourney(key);
    return m_store.loadDay(key, day);
}

std::vector<DailyWeatherRecord> StageOrchestrator::simulate(JourneyState& state, int days)
{
    ValidateStageDuration(days);

    std::vector<DailyWeatherRecord> out;
    out.reserve(static_cast<std::size_t>(days));
    for (int i = 0; i < days; ++i)
    {
        DayOutcome day = m_days.generate(state, state.region, state.season, m_rng);
        out.push_back(std::move(day.record));
        state = std::move(day.next);
    }
    state.currentStage += 1;
    return out;
}

} // namespace voyage::journey
