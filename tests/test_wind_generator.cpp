// tests/test_wind_generator.cpp

#include <doctest/doctest.h>

#include "test_support/ScriptedRandomSource.hpp"
#include "voyage/weather/WindGenerator.hpp"

using namespace voyage;
using namespace voyage::weather;
using voyage::test::ScriptedRandomSource;

TEST_CASE("WindGenerator first day rolls dawn fresh and carries it without changes")
{
    const WindGenerator gen(WeatherTables::Default());
    // strength 7 (strong), direction 2 (tailwind), then three quiet checks
    ScriptedRandomSource rng{7, 2, 4, 9, 10};

    const WindTimeline day = gen.generateDay(std::nullopt, rng);
    CHECK(rng.remaining() == 0);

    CHECK(day[0].period == TimeOfDay::Dawn);
    CHECK(day[3].period == TimeOfDay::Midnight);
    for (const WindReading& r : day) {
        CHECK(r.strength == WindStrength::Strong);
        CHECK(r.direction == WindDirection::Tailwind);
        CHECK_FALSE(r.changed);
        CHECK(r.speedPct == 20);
        CHECK(r.requiresTacking);
    }
}

TEST_CASE("WindGenerator continuing day carries yesterday's midnight into dawn")
{
    const WindGenerator gen(WeatherTables::Default());
    ScriptedRandomSource rng{10, 10, 10, 10};

    const WindState yesterday{WindStrength::Light, WindDirection::Headwind};
    const WindTimeline day = gen.generateDay(yesterday, rng);

    CHECK(rng.consumed() == 4);
    CHECK(day[0].state() == yesterday);
    CHECK(day[3].state() == yesterday);
    CHECK(day[0].speedPct == -5);
}

TEST_CASE("WindGenerator change steps strength by one level")
{
    const WindGenerator gen(WeatherTables::Default());

    SUBCASE("stronger, direction kept") {
        // dawn: change (1), stronger (1), keep direction (2); rest quiet
        ScriptedRandomSource rng{1, 1, 2, 10, 10, 10};
        const WindTimeline day = gen.generateDay(WindState{WindStrength::Bracing, WindDirection::Sidewind}, rng);
        CHECK(day[0].changed);
        CHECK(day[0].strength == WindStrength::Strong);
        CHECK(day[0].direction == WindDirection::Sidewind);
        CHECK_FALSE(day[1].changed);
        CHECK(day[3].strength == WindStrength::Strong);
    }
    SUBCASE("lighter with a direction re-roll") {
        // midday: change, lighter (2), re-roll direction (1) -> d10 9 headwind
        ScriptedRandomSource rng{10, 1, 2, 1, 9, 10, 10};
        const WindTimeline day = gen.generateDay(WindState{WindStrength::Bracing, WindDirection::Tailwind}, rng);
        CHECK_FALSE(day[0].changed);
        CHECK(day[1].changed);
        CHECK(day[1].strength == WindStrength::Light);
        CHECK(day[1].direction == WindDirection::Headwind);
        CHECK(day[2].state() == day[1].state());
    }
    SUBCASE("very strong can only weaken") {
        ScriptedRandomSource rng{1, 1, 2, 10, 10, 10};
        const WindTimeline day = gen.generateDay(WindState{WindStrength::VeryStrong, WindDirection::Tailwind}, rng);
        CHECK(day[0].strength == WindStrength::Strong);
    }
    SUBCASE("calm can only strengthen") {
        ScriptedRandomSource rng{1, 2, 2, 10, 10, 10};
        const WindTimeline day = gen.generateDay(WindState{WindStrength::Calm, WindDirection::Tailwind}, rng);
        CHECK(day[0].strength == WindStrength::Light);
    }
}

TEST_CASE("WindGenerator readings always carry the table modifiers")
{
    const WeatherTables& tables = WeatherTables::Default();
    const WindGenerator gen(tables);
    rng::PcgRandomSource rng(1234);

    std::optional<WindState> carry;
    for (int d = 0; d < 50; ++d) {
        const WindTimeline day = gen.generateDay(carry, rng);
        for (const WindReading& r : day) {
            const WindModifiers& m = tables.windModifiers(r.strength, r.direction);
            CHECK(r.speedPct == m.speedPct);
            CHECK(r.handlingPenalty == m.handlingPenalty);
            CHECK(r.requiresTacking == m.requiresTacking);
        }
        carry = day.back().state();
    }
}

TEST_CASE("MostCommonStrength prefers the strongest on a tie")
{
    WindTimeline t{};
    t[0].strength = WindStrength::Light;
    t[1].strength = WindStrength::Light;
    t[2].strength = WindStrength::Strong;
    t[3].strength = WindStrength::Strong;
    CHECK(MostCommonStrength(t) == WindStrength::Strong);

    t[3].strength = WindStrength::Calm;
    CHECK(MostCommonStrength(t) == WindStrength::Light);
}
