// tests/test_journey_store.cpp
//
// Both store implementations against the same contract, then the JSON file
// store's document handling: schema migration, preserved extras, bad files.

#include <doctest/doctest.h>

#include "test_support/TempDir.hpp"
#include "voyage/core/Errors.hpp"
#include "voyage/io/AtomicFile.hpp"
#include "voyage/journey/JourneyJson.hpp"
#include "voyage/journey/JourneyStore.hpp"

#include <nlohmann/json.hpp>

#include <string>

using namespace voyage;
using namespace voyage::journey;
using namespace voyage::weather;
using nlohmann::json;
using voyage::test::TempDir;

namespace {

JourneyState SampleState()
{
    JourneyState s;
    s.currentDay    = 4;
    s.currentStage  = 2;
    s.stageDuration = 3;
    s.displayMode   = DisplayMode::Detailed;
    s.region        = Region::Ostland;
    s.season        = Season::Autumn;
    s.event.coldFront = {1, 2};
    s.cooldowns     = Cooldowns{0, 15};
    s.lastWind      = WindState{WindStrength::Strong, WindDirection::Headwind};
    s.startedUtc    = "2024-09-20T06:30:00Z";
    return s;
}

DailyWeatherRecord SampleDay(int day)
{
    const WeatherTables& t = WeatherTables::Default();

    DailyWeatherRecord r;
    r.day    = day;
    r.region = Region::Ostland;
    r.season = Season::Autumn;
    for (std::size_t i = 0; i < r.wind.size(); ++i) {
        WindReading& w = r.wind[i];
        w.period    = static_cast<TimeOfDay>(i);
        w.strength  = WindStrength::Strong;
        w.direction = WindDirection::Headwind;
        const WindModifiers& m = t.windModifiers(w.strength, w.direction);
        w.speedPct        = m.speedPct;
        w.handlingPenalty = m.handlingPenalty;
        w.requiresTacking = m.requiresTacking;
        w.changed         = i == 2;
    }
    r.mostCommonWind       = WindStrength::Strong;
    r.weatherRoll          = 45;
    r.weather              = WeatherType::Fair;
    r.temperatureRoll      = 60;
    r.baseTemperature      = 13;
    r.actualTemperature    = 3 + day;
    r.perceivedTemperature = r.actualTemperature - 10;
    r.category             = TemperatureCategory::VeryLow;
    r.description          = "Very low: About 10 degrees colder than average\nCold Front: Day 2 of 2 (Final Day)";
    r.event.coldFront      = {1, 2};
    r.cooldowns            = Cooldowns{0, 15};
    return r;
}

void CheckStoreContract(JourneyStore& store)
{
    const std::string key = "party-1";

    CHECK_FALSE(store.loadJourney(key).has_value());
    CHECK_FALSE(store.loadDay(key, 1).has_value());
    CHECK(store.loadDays(key).empty());
    CHECK_FALSE(store.eraseJourney(key));
    CHECK_THROWS_AS(store.saveDay(key, SampleDay(1)), JourneyNotFound);
    CHECK_THROWS_AS(store.commitDay(key, SampleDay(1), SampleState()), JourneyNotFound);
    CHECK_FALSE(store.loadJourney(key).has_value());

    const JourneyState s = SampleState();
    store.saveJourney(key, s);
    REQUIRE(store.loadJourney(key).has_value());
    CHECK(*store.loadJourney(key) == s);

    // out of order on purpose; loadDays sorts
    store.saveDay(key, SampleDay(3));
    store.saveDay(key, SampleDay(1));
    store.saveDay(key, SampleDay(2));

    const auto days = store.loadDays(key);
    REQUIRE(days.size() == 3);
    CHECK(days[0].day == 1);
    CHECK(days[1].day == 2);
    CHECK(days[2].day == 3);
    CHECK(days[1] == SampleDay(2));

    // same day number replaces
    DailyWeatherRecord again = SampleDay(2);
    again.overridden = true;
    again.region     = Region::Kislev;
    store.saveDay(key, again);
    CHECK(store.loadDays(key).size() == 3);
    CHECK(*store.loadDay(key, 2) == again);

    // saving the state leaves the days alone
    JourneyState moved = s;
    moved.currentDay = 5;
    store.saveJourney(key, moved);
    CHECK(store.loadDays(key).size() == 3);
    CHECK(store.loadJourney(key)->currentDay == 5);

    // a committed day lands together with the state that follows it
    JourneyState next = moved;
    next.currentDay = 6;
    next.event      = {};
    store.commitDay(key, SampleDay(5), next);
    CHECK(store.loadDays(key).size() == 4);
    CHECK(*store.loadDay(key, 5) == SampleDay(5));
    CHECK(*store.loadJourney(key) == next);

    CHECK(store.eraseJourney(key));
    CHECK_FALSE(store.loadJourney(key).has_value());
    CHECK(store.loadDays(key).empty());
}

void WriteRaw(const JsonFileJourneyStore& store, const std::string& key, const std::string& text)
{
    std::string err;
    REQUIRE(io::write_atomic(store.pathFor(key), text, &err));
}

json ReadRaw(const JsonFileJourneyStore& store, const std::string& key)
{
    std::string text;
    REQUIRE(io::read_all(store.pathFor(key), text));
    return json::parse(text);
}

} // namespace

TEST_CASE("InMemoryJourneyStore contract")
{
    InMemoryJourneyStore store;
    CheckStoreContract(store);
}

TEST_CASE("JsonFileJourneyStore contract")
{
    const TempDir dir("store");
    JsonFileJourneyStore store(dir.path());
    CheckStoreContract(store);
}

TEST_CASE("JsonFileJourneyStore writes one versioned document per journey")
{
    const TempDir dir("store");
    JsonFileJourneyStore store(dir.path());

    store.saveJourney("keel", SampleState());
    store.saveDay("keel", SampleDay(1));

    CHECK(store.pathFor("keel") == dir.path() / "journeys" / "keel.json");
    const json j = ReadRaw(store, "keel");
    CHECK(j.at("schema_version").get<int>() == kJourneySchemaVersion);
    CHECK(j.at("key").get<std::string>() == "keel");
    CHECK(j.at("journey").at("region").get<std::string>() == "ostland");
    CHECK(j.at("journey").at("display_mode").get<std::string>() == "detailed");
    CHECK(j.at("journey").at("event").at("cold_front").at("remaining").get<int>() == 1);
    CHECK(j.at("days").size() == 1);
    CHECK(j.at("days")[0].at("wind").size() == 4);
    CHECK(j.at("days")[0].at("wind")[3].at("period").get<std::string>() == "midnight");

    // the previous version is kept beside it and removed with the journey
    const auto bak = io::default_backup_path(store.pathFor("keel"));
    CHECK(std::filesystem::exists(bak));
    CHECK(store.eraseJourney("keel"));
    CHECK_FALSE(std::filesystem::exists(store.pathFor("keel")));
    CHECK_FALSE(std::filesystem::exists(bak));
}

TEST_CASE("JsonFileJourneyStore commits a day and the journey in one write")
{
    const TempDir dir("store");
    JsonFileJourneyStore store(dir.path());

    const JourneyState s = SampleState();
    store.saveJourney("keel", s);

    JourneyState next = s;
    next.currentDay += 1;
    store.commitDay("keel", SampleDay(4), next);

    const json j = ReadRaw(store, "keel");
    CHECK(j.at("journey").at("current_day").get<int>() == 5);
    CHECK(j.at("days").size() == 1);

    // the backup is the document from before the commit, with no half step between
    std::string text;
    REQUIRE(io::read_all(io::default_backup_path(store.pathFor("keel")), text));
    const json bak = json::parse(text);
    CHECK(bak.at("journey").at("current_day").get<int>() == 4);
    CHECK(bak.at("days").empty());
}

TEST_CASE("JsonFileJourneyStore keeps fields it does not know about")
{
    const TempDir dir("store");
    JsonFileJourneyStore store(dir.path());
    store.saveJourney("barge", SampleState());

    json j = ReadRaw(store, "barge");
    j["party_notes"] = "hired a second boatman in Wolfenburg";
    WriteRaw(store, "barge", j.dump());

    JourneyState s = *store.loadJourney("barge");
    s.currentDay += 1;
    store.saveJourney("barge", s);

    const json after = ReadRaw(store, "barge");
    REQUIRE(after.contains("party_notes"));
    CHECK(after["party_notes"].get<std::string>() == "hired a second boatman in Wolfenburg");
    CHECK(after.at("journey").at("current_day").get<int>() == 5);
}

TEST_CASE("JsonFileJourneyStore migrates flat v0 documents")
{
    const TempDir dir("store");
    JsonFileJourneyStore store(dir.path());

    const char* v0 = R"({
        "schema_version": 0,
        "journey": {
            "province": "kislev",
            "season": "winter",
            "stage_display_mode": "detailed",
            "current_day": 2,
            "stage_duration": 4,
            "cold_front_days_remaining": 2,
            "cold_front_total_duration": 4,
            "heat_wave_days_remaining": 0,
            "heat_wave_total_duration": 0,
            "days_since_last_cold_front": 0,
            "days_since_last_heat_wave": 12
        },
        "days": [{
            "day_number": 1,
            "province": "kislev",
            "season": "winter",
            "wind_timeline": [
                {"period": "dawn",     "strength": "light", "direction": "tailwind"},
                {"period": "midday",   "strength": "light", "direction": "tailwind"},
                {"period": "dusk",     "strength": "calm",  "direction": "tailwind"},
                {"period": "midnight", "strength": "calm",  "direction": "tailwind"}
            ],
            "weather_type": "snow",
            "temperature_actual": -17,
            "temperature_category": "very_low",
            "cold_front_days_remaining": 3,
            "cold_front_total_duration": 4
        }]
    })";
    WriteRaw(store, "old_party", v0);

    const auto s = store.loadJourney("old_party");
    REQUIRE(s.has_value());
    CHECK(s->region == Region::Kislev);
    CHECK(s->season == Season::Winter);
    CHECK(s->displayMode == DisplayMode::Detailed);
    CHECK(s->currentDay == 2);
    CHECK(s->stageDuration == 4);
    CHECK(s->event.coldFront.remaining == 2);
    CHECK(s->event.coldFront.total == 4);
    CHECK(s->cooldowns.daysSinceColdFront == 0);
    CHECK(s->cooldowns.daysSinceHeatWave == 12);
    CHECK_FALSE(s->lastWind.has_value());

    const auto d = store.loadDay("old_party", 1);
    REQUIRE(d.has_value());
    CHECK(d->weather == WeatherType::Snow);
    CHECK(d->actualTemperature == -17);
    CHECK(d->category == TemperatureCategory::VeryLow);
    CHECK(d->event.coldFront.remaining == 3);
    // tie between light and calm goes to the stronger
    CHECK(d->mostCommonWind == WindStrength::Light);

    // the next save writes the current layout
    store.saveJourney("old_party", *s);
    const json j = ReadRaw(store, "old_party");
    CHECK(j.at("schema_version").get<int>() == kJourneySchemaVersion);
    CHECK(j.at("journey").contains("region"));
    CHECK_FALSE(j.at("journey").contains("province"));
}

TEST_CASE("JsonFileJourneyStore bad documents are StorageErrors")
{
    const TempDir dir("store");
    JsonFileJourneyStore store(dir.path());

    SUBCASE("malformed JSON") {
        WriteRaw(store, "bad", "{ \"journey\": ");
        CHECK_THROWS_AS((void)store.loadJourney("bad"), StorageError);
    }
    SUBCASE("root is not an object") {
        WriteRaw(store, "bad", "[1, 2, 3]");
        CHECK_THROWS_AS((void)store.loadJourney("bad"), StorageError);
    }
    SUBCASE("unknown region key") {
        WriteRaw(store, "bad", R"({"schema_version":1,"journey":{"region":"lustria","season":"summer"}})");
        CHECK_THROWS_AS((void)store.loadJourney("bad"), StorageError);
    }
    SUBCASE("newer schema") {
        WriteRaw(store, "bad", R"({"schema_version":7,"journey":{"region":"reikland","season":"summer"}})");
        CHECK_THROWS_AS((void)store.loadJourney("bad"), StorageError);
    }
    SUBCASE("day with the wrong number of wind readings") {
        WriteRaw(store, "bad", R"({"schema_version":1,"journey":{"region":"reikland","season":"summer"},
            "days":[{"day":1,"region":"reikland","season":"summer","wind":[],
                     "weather":"dry","actual_temperature":21,"category":"average"}]})");
        CHECK_THROWS_AS((void)store.loadDays("bad"), StorageError);
    }
}

TEST_CASE("Journey keys are limited to safe file names")
{
    CHECK_NOTHROW(ValidateJourneyKey("ok-key_1"));
    CHECK_NOTHROW(ValidateJourneyKey(std::string(64, 'a')));
    CHECK_THROWS_AS(ValidateJourneyKey(""), ConfigurationError);
    CHECK_THROWS_AS(ValidateJourneyKey(std::string(65, 'a')), ConfigurationError);
    CHECK_THROWS_AS(ValidateJourneyKey("../etc"), ConfigurationError);
    CHECK_THROWS_AS(ValidateJourneyKey("has space"), ConfigurationError);

    const TempDir dir("store");
    JsonFileJourneyStore store(dir.path());
    CHECK_THROWS_AS((void)store.loadJourney("a/b"), ConfigurationError);
}
