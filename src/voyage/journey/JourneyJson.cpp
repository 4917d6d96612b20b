// src/voyage/journey/JourneyJson.cpp
#include "voyage/journey/JourneyJson.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <unordered_set>

namespace voyage::weather {

// ---------- enums ----------
void to_json(json& j, Season v)              { j = ToKey(v); }
void from_json(const json& j, Season& v)     { v = ParseSeason(j.get<std::string>()); }
void to_json(json& j, Region v)              { j = ToKey(v); }
void from_json(const json& j, Region& v)     { v = ParseRegion(j.get<std::string>()); }
void to_json(json& j, WindStrength v)        { j = ToKey(v); }
void from_json(const json& j, WindStrength& v)  { v = ParseWindStrength(j.get<std::string>()); }
void to_json(json& j, WindDirection v)       { j = ToKey(v); }
void from_json(const json& j, WindDirection& v) { v = ParseWindDirection(j.get<std::string>()); }
void to_json(json& j, WeatherType v)         { j = ToKey(v); }
void from_json(const json& j, WeatherType& v)   { v = ParseWeatherType(j.get<std::string>()); }
void to_json(json& j, TemperatureCategory v) { j = ToKey(v); }
void from_json(const json& j, TemperatureCategory& v) { v = ParseTemperatureCategory(j.get<std::string>()); }
void to_json(json& j, TimeOfDay v)           { j = ToKey(v); }
void from_json(const json& j, TimeOfDay& v)  { v = ParseTimeOfDay(j.get<std::string>()); }

// ---------- WindState ----------
void to_json(json& j, const WindState& v) {
    j = json::object({
        {"strength",  v.strength},
        {"direction", v.direction}
    });
}
void from_json(const json& j, WindState& v) {
    v.strength  = j.at("strength").get<WindStrength>();
    v.direction = j.at("direction").get<WindDirection>();
}

// ---------- WindReading ----------
void to_json(json& j, const WindReading& v) {
    j = json::object({
        {"period",           v.period},
        {"strength",         v.strength},
        {"direction",        v.direction},
        {"speed_pct",        v.speedPct},
        {"handling_penalty", v.handlingPenalty},
        {"requires_tacking", v.requiresTacking},
        {"changed",          v.changed}
    });
}
void from_json(const json& j, WindReading& v) {
    v.period          = j.at("period").get<TimeOfDay>();
    v.strength        = j.at("strength").get<WindStrength>();
    v.direction       = j.at("direction").get<WindDirection>();
    v.speedPct        = j.value("speed_pct", 0);
    v.handlingPenalty = j.value("handling_penalty", 0);
    v.requiresTacking = j.value("requires_tacking", false);
    v.changed         = j.value("changed", false);
}

// ---------- events ----------
void to_json(json& j, const EventProgress& v) {
    j = json::object({{"remaining", v.remaining}, {"total", v.total}});
}
void from_json(const json& j, EventProgress& v) {
    v.remaining = j.value("remaining", 0);
    v.total     = j.value("total", 0);
}

void to_json(json& j, const EventState& v) {
    j = json::object({{"cold_front", v.coldFront}, {"heat_wave", v.heatWave}});
}
void from_json(const json& j, EventState& v) {
    v.coldFront = j.value("cold_front", EventProgress{});
    v.heatWave  = j.value("heat_wave", EventProgress{});
}

void to_json(json& j, const Cooldowns& v) {
    j = json::object({
        {"days_since_cold_front", v.daysSinceColdFront},
        {"days_since_heat_wave",  v.daysSinceHeatWave}
    });
}
void from_json(const json& j, Cooldowns& v) {
    v.daysSinceColdFront = j.value("days_since_cold_front", CooldownTracker::kNever);
    v.daysSinceHeatWave  = j.value("days_since_heat_wave", CooldownTracker::kNever);
}

} // namespace voyage::weather

namespace voyage::journey {

using namespace voyage::weather;

// ---------- helpers ----------

static json collect_extras(const json& obj,
                           std::initializer_list<const char*> known)
{
    json extras = json::object();
    if (!obj.is_object()) return extras;

    std::unordered_set<std::string> known_set;
    known_set.reserve(known.size());
    for (auto* k : known) known_set.emplace(k);

    for (const auto& [k, v] : obj.items()) {
        if (!known_set.count(k)) extras[k] = v;
    }
    return extras;
}

static void merge_extras(json& dst, const json& extras)
{
    if (!dst.is_object() || !extras.is_object()) return;
    for (const auto& [k, v] : extras.items()) {
        // Do not overwrite known fields; only add missing ones.
        if (!dst.contains(k)) { dst[k] = v; }
    }
}

// Moves `from` to `to` inside `obj` unless `to` already exists.
static void rename_key(json& obj, const char* from, const char* to)
{
    if (obj.is_object() && obj.contains(from) && !obj.contains(to)) {
        obj[to] = obj[from];
        obj.erase(from);
    }
}

// ---------- DisplayMode ----------
void to_json(json& j, DisplayMode v)          { j = ToKey(v); }
void from_json(const json& j, DisplayMode& v) { v = ParseDisplayMode(j.get<std::string>()); }

// ---------- JourneyState ----------
void to_json(json& j, const JourneyState& v) {
    j = json::object({
        {"current_day",    v.currentDay},
        {"current_stage",  v.currentStage},
        {"stage_duration", v.stageDuration},
        {"display_mode",   v.displayMode},
        {"region",         v.region},
        {"season",         v.season},
        {"event",          v.event},
        {"cooldowns",      v.cooldowns},
        {"last_wind",      v.lastWind ? json(*v.lastWind) : json(nullptr)},
        {"started_utc",    v.startedUtc}
    });
}
void from_json(const json& j, JourneyState& v) {
    v.currentDay    = j.value("current_day", 1);
    v.currentStage  = j.value("current_stage", 1);
    v.stageDuration = j.value("stage_duration", kDefaultStageDays);
    v.displayMode   = j.value("display_mode", DisplayMode::Simple);
    v.region        = j.at("region").get<Region>();
    v.season        = j.at("season").get<Season>();
    v.event         = j.value("event", EventState{});
    v.cooldowns     = j.value("cooldowns", Cooldowns{});
    v.startedUtc    = j.value("started_utc", std::string{});

    v.lastWind.reset();
    if (j.contains("last_wind") && j["last_wind"].is_object())
        v.lastWind = j["last_wind"].get<WindState>();
}

// ---------- DailyWeatherRecord ----------
void to_json(json& j, const DailyWeatherRecord& v) {
    j = json::object({
        {"day",                   v.day},
        {"region",                v.region},
        {"season",                v.season},
        {"wind",                  v.wind},
        {"most_common_wind",      v.mostCommonWind},
        {"weather_roll",          v.weatherRoll},
        {"weather",               v.weather},
        {"temperature_roll",      v.temperatureRoll},
        {"base_temperature",      v.baseTemperature},
        {"actual_temperature",    v.actualTemperature},
        {"perceived_temperature", v.perceivedTemperature},
        {"category",              v.category},
        {"description",           v.description},
        {"event",                 v.event},
        {"cooldowns",             v.cooldowns},
        {"overridden",            v.overridden}
    });
}
void from_json(const json& j, DailyWeatherRecord& v) {
    v.day    = j.at("day").get<int>();
    v.region = j.at("region").get<Region>();
    v.season = j.at("season").get<Season>();

    const json& wind = j.at("wind");
    if (!wind.is_array() || wind.size() != kPeriodsPerDay) {
        throw nlohmann::json::type_error::create(
            302, "wind expects an array of 4 readings", &wind);
    }
    for (std::size_t i = 0; i < kPeriodsPerDay; ++i)
        v.wind[i] = wind.at(i).get<WindReading>();

    v.mostCommonWind       = j.contains("most_common_wind")
                                 ? j["most_common_wind"].get<WindStrength>()
                                 : MostCommonStrength(v.wind);
    v.weatherRoll          = j.value("weather_roll", 0);
    v.weather              = j.at("weather").get<WeatherType>();
    v.temperatureRoll      = j.value("temperature_roll", 0);
    v.baseTemperature      = j.value("base_temperature", 0);
    v.actualTemperature    = j.at("actual_temperature").get<int>();
    v.perceivedTemperature = j.value("perceived_temperature", v.actualTemperature);
    v.category             = j.at("category").get<TemperatureCategory>();
    v.description          = j.value("description", std::string{});
    v.event                = j.value("event", EventState{});
    v.cooldowns            = j.value("cooldowns", Cooldowns{});
    v.overridden           = j.value("overridden", false);
}

// ---------- JourneyDocument ----------
void to_json(json& j, const JourneyDocument& v) {
    j = json::object({
        {"schema_version", v.schema_version},
        {"key",            v.key},
        {"last_saved_utc", v.last_saved_utc},
        {"journey",        v.journey},
        {"days",           v.days}
    });
    merge_extras(j, v.extras);
}
void from_json(const json& j, JourneyDocument& v) {
    v.schema_version = j.value("schema_version", kJourneySchemaVersion);
    v.key            = j.value("key", std::string{});
    v.last_saved_utc = j.value("last_saved_utc", std::string{});
    v.journey        = j.at("journey").get<JourneyState>();
    v.days           = j.value("days", std::vector<DailyWeatherRecord>{});
    v.extras = collect_extras(j, {"schema_version","key","last_saved_utc","journey","days"});
}

// ---------- Migration (JSON-level) ----------
// v0 is the flat column layout the journey tables were exported with:
// "province" instead of "region", and cooldown/event counters as loose fields.
static void migrate_event_columns(json& obj)
{
    if (!obj.is_object() || obj.contains("event")) return;
    json ev = json::object();
    ev["cold_front"] = json::object({
        {"remaining", obj.value("cold_front_days_remaining", 0)},
        {"total",     obj.value("cold_front_total_duration", 0)}
    });
    ev["heat_wave"] = json::object({
        {"remaining", obj.value("heat_wave_days_remaining", 0)},
        {"total",     obj.value("heat_wave_total_duration", 0)}
    });
    for (const char* k : {"cold_front_days_remaining", "cold_front_total_duration",
                          "heat_wave_days_remaining", "heat_wave_total_duration"})
        obj.erase(k);
    obj["event"] = std::move(ev);
}

static void migrate_cooldown_columns(json& obj)
{
    if (!obj.is_object() || obj.contains("cooldowns")) return;
    obj["cooldowns"] = json::object({
        {"days_since_cold_front", obj.value("days_since_last_cold_front", CooldownTracker::kNever)},
        {"days_since_heat_wave",  obj.value("days_since_last_heat_wave", CooldownTracker::kNever)}
    });
    obj.erase("days_since_last_cold_front");
    obj.erase("days_since_last_heat_wave");
}

bool MigrateJsonInPlace(json& j, int target_schema_version, std::string& outError)
{
    try {
        int file_ver = j.value("schema_version", kJourneySchemaVersion);
        while (file_ver < target_schema_version) {
            if (file_ver == 0) {
                if (j.contains("journey") && j["journey"].is_object()) {
                    json& js = j["journey"];
                    rename_key(js, "province", "region");
                    rename_key(js, "stage_display_mode", "display_mode");
                    migrate_event_columns(js);
                    migrate_cooldown_columns(js);
                }
                if (j.contains("days") && j["days"].is_array()) {
                    for (auto& d : j["days"]) {
                        rename_key(d, "day_number", "day");
                        rename_key(d, "province", "region");
                        rename_key(d, "wind_timeline", "wind");
                        rename_key(d, "weather_type", "weather");
                        rename_key(d, "temperature_actual", "actual_temperature");
                        rename_key(d, "temperature_category", "category");
                        migrate_event_columns(d);
                    }
                }
                file_ver = 1;
                j["schema_version"] = file_ver;
            } else {
                outError = "No migration path for schema_version=" + std::to_string(file_ver);
                return false;
            }
        }
        if (file_ver > target_schema_version) {
            outError = "schema_version=" + std::to_string(file_ver) + " is newer than this build supports";
            return false;
        }
        return true;
    } catch (const nlohmann::json::exception& e) {
        outError = e.what();
        return false;
    }
}

std::string NowUtcIso8601()
{
    using clock = std::chrono::system_clock;
    auto t = clock::now();
    std::time_t tt = clock::to_time_t(t);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace voyage::journey
