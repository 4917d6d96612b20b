// src/voyage/app/WeatherFormat.cpp
#include "voyage/app/WeatherFormat.hpp"

#include <spdlog/fmt/fmt.h>

#include <iterator>

namespace voyage::app {

using namespace voyage::weather;
using journey::DailyWeatherRecord;
using journey::DisplayMode;

std::string FormatPercent(int pct)
{
    return pct > 0 ? fmt::format("+{}%", pct) : fmt::format("{}%", pct);
}

namespace {

void AppendWindLine(fmt::memory_buffer& buf, const WindReading& r, const WeatherTables& tables)
{
    const WindModifiers& mods = tables.windModifiers(r.strength, r.direction);
    fmt::format_to(std::back_inserter(buf), "    {:<9} {:<12} {:<9} speed {:>5}",
                   DisplayName(r.period), DisplayName(r.strength),
                   r.strength == WindStrength::Calm ? std::string("-") : DisplayName(r.direction),
                   FormatPercent(r.speedPct));
    if (r.handlingPenalty != 0)
        fmt::format_to(std::back_inserter(buf), ", handling {}", r.handlingPenalty);
    if (r.requiresTacking)
        fmt::format_to(std::back_inserter(buf), ", tacking");
    if (r.changed)
        fmt::format_to(std::back_inserter(buf), "  (changed)");
    fmt::format_to(std::back_inserter(buf), "\n");
    if (!mods.notes.empty() && r.strength == WindStrength::VeryStrong)
        fmt::format_to(std::back_inserter(buf), "      ! {}\n", mods.notes);
}

} // namespace

std::string FormatDay(const DailyWeatherRecord& day, DisplayMode mode, const WeatherTables& tables)
{
    fmt::memory_buffer buf;
    auto out = std::back_inserter(buf);

    const WeatherEffects& fx = tables.effects(day.weather);

    fmt::format_to(out, "Day {} - {}, {}{}\n", day.day, DisplayName(day.region), DisplayName(day.season),
                   day.overridden ? " (override)" : "");
    fmt::format_to(out, "  Weather:     {}\n", fx.name);
    fmt::format_to(out, "  Temperature: {} C, feels like {} C ({})\n", day.actualTemperature,
                   day.perceivedTemperature, RelativeFeel(day.actualTemperature - day.baseTemperature));
    fmt::format_to(out, "  Wind:        mostly {}\n", DisplayName(day.mostCommonWind));

    // Description: category text, then any event progress lines.
    std::string_view desc = day.description;
    while (!desc.empty())
    {
        const auto nl = desc.find('\n');
        fmt::format_to(out, "  {}\n", desc.substr(0, nl));
        if (nl == std::string_view::npos) break;
        desc.remove_prefix(nl + 1);
    }

    if (mode == DisplayMode::Detailed)
    {
        fmt::format_to(out, "  Rolls: weather {}, temperature {} (seasonal average {} C)\n",
                       day.weatherRoll, day.temperatureRoll, day.baseTemperature);
        fmt::format_to(out, "  Wind timeline:\n");
        for (const WindReading& r : day.wind)
            AppendWindLine(buf, r, tables);
        fmt::format_to(out, "  {}\n", fx.description);
        for (const std::string& e : fx.effects)
            fmt::format_to(out, "    - {}\n", e);
    }

    return fmt::to_string(buf);
}

std::string FormatStage(int stage, const std::vector<DailyWeatherRecord>& days, DisplayMode mode,
                        const WeatherTables& tables)
{
    std::string out;
    if (!days.empty())
        out += fmt::format("Stage {}: days {}-{}\n\n", stage, days.front().day, days.back().day);
    for (const DailyWeatherRecord& d : days)
    {
        out += FormatDay(d, mode, tables);
        out += "\n";
    }
    return out;
}

std::string FormatStatus(const std::string& key, const journey::JourneyState& state,
                         const journey::CooldownStatus& cooldowns)
{
    fmt::memory_buffer buf;
    auto out = std::back_inserter(buf);

    fmt::format_to(out, "Journey '{}'\n", key);
    fmt::format_to(out, "  Region/season: {}, {}\n", DisplayName(state.region), DisplayName(state.season));
    fmt::format_to(out, "  Next day: {}   Stage: {}   Stage length: {} day(s)   Display: {}\n",
                   state.currentDay, state.currentStage, state.stageDuration, journey::ToKey(state.displayMode));
    if (!state.startedUtc.empty())
        fmt::format_to(out, "  Started: {}\n", state.startedUtc);

    const auto line = [&](const char* name, const journey::EventReadiness& r) {
        if (r.active)
            fmt::format_to(out, "  {}: active, {} of {} day(s) to go\n", name, r.progress.remaining, r.progress.total);
        else if (r.ready)
            fmt::format_to(out, "  {}: ready ({} day(s) since last)\n", name, r.daysSince);
        else if (r.daysUntilReady > 0)
            fmt::format_to(out, "  {}: on cooldown, {} more day(s)\n", name, r.daysUntilReady);
        else
            fmt::format_to(out, "  {}: held while another event runs\n", name);
    };
    line("Cold front", cooldowns.coldFront);
    line("Heat wave", cooldowns.heatWave);

    return fmt::to_string(buf);
}

} // namespace voyage::app
