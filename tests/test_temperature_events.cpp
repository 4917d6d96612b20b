// tests/test_temperature_events.cpp
//
// Cold fronts, heat waves and their cooldowns. Reikland in summer has a base
// of 21 C throughout.

#include <doctest/doctest.h>

#include "test_support/ScriptedRandomSource.hpp"
#include "voyage/core/Errors.hpp"
#include "voyage/weather/TemperatureEvents.hpp"

#include <string>

using namespace voyage;
using namespace voyage::weather;
using voyage::test::ScriptedRandomSource;

namespace {

constexpr int kBase = 21;

TemperatureInput Day(int roll, EventState prev = {}, Cooldowns cd = {})
{
    TemperatureInput in;
    in.region    = Region::Reikland;
    in.season    = Season::Summer;
    in.roll      = roll;
    in.previous  = prev;
    in.cooldowns = cd;
    return in;
}

bool Contains(const std::string& haystack, const char* needle)
{
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("Cold front scenario: start, continue, suppressed trigger, end, cooldown")
{
    const TemperatureEventEngine engine(WeatherTables::Default());

    // Day 1: no event, cooldowns at "never", trigger roll with a 3-day draw.
    ScriptedRandomSource rng{3};
    const TemperatureResult d1 = engine.resolve(Day(2), rng);
    CHECK(rng.remaining() == 0);
    CHECK(d1.started == EventKind::ColdFront);
    CHECK(d1.event.coldFront.remaining == 3);
    CHECK(d1.event.coldFront.total == 3);
    CHECK_FALSE(d1.event.heatWave.active());
    CHECK(d1.cooldowns.daysSinceColdFront == 0);
    CHECK(Contains(d1.description, "Cold Front: Day 1 of 3"));
    CHECK(Contains(d1.description, "emigrating birds"));
    // -10 for the front, table delta -10 held to -5
    CHECK(d1.actualTemperature == kBase - 15);

    // Day 2: carried remaining 3 goes to 2, day 2 of 3.
    ScriptedRandomSource none;
    const TemperatureResult d2 = engine.resolve(Day(50, d1.event, d1.cooldowns), none);
    CHECK(d2.started == EventKind::None);
    CHECK(d2.event.coldFront.remaining == 2);
    CHECK(d2.event.coldFront.total == 3);
    CHECK(Contains(d2.description, "Cold Front: Day 2 of 3"));
    CHECK(d2.actualTemperature == kBase - 10);
    CHECK(d2.category == TemperatureCategory::VeryLow);
    CHECK(d2.cooldowns.daysSinceColdFront == 0);

    // Day 3: the trigger value is ignored while the front runs; final day.
    const TemperatureResult d3 = engine.resolve(Day(2, d2.event, d2.cooldowns), none);
    CHECK(d3.suppressed);
    CHECK(d3.started == EventKind::None);
    CHECK(d3.event.coldFront.remaining == 1);
    CHECK(d3.event.coldFront.total == 3);
    CHECK(Contains(d3.description, "Cold Front: Day 3 of 3 (Final Day)"));

    // Day 4: the front's last carried day; it still chills, then is gone.
    const TemperatureResult d4 = engine.resolve(Day(50, d3.event, d3.cooldowns), none);
    CHECK(d4.ended == EventKind::ColdFront);
    CHECK_FALSE(d4.event.coldFront.active());
    CHECK(d4.actualTemperature == kBase - 10);
    CHECK_FALSE(Contains(d4.description, "Cold Front"));
    CHECK(d4.cooldowns.daysSinceColdFront == 1);

    CHECK(none.consumed() == 0);
}

TEST_CASE("Scenario: day after the event ended counts 1 and a trigger roll does not start a new front")
{
    const TemperatureEventEngine engine(WeatherTables::Default());
    ScriptedRandomSource none;

    EventState ended;
    ended.coldFront = {0, 3};
    const TemperatureResult r = engine.resolve(Day(2, ended, Cooldowns{0, 99}), none);

    CHECK(r.started == EventKind::None);
    CHECK_FALSE(r.event.coldFront.active());
    CHECK(r.cooldowns.daysSinceColdFront == 1);
    // plain table delta, no event modifier
    CHECK(r.actualTemperature == kBase - 10);
    CHECK(none.consumed() == 0);
}

TEST_CASE("Cooldown must reach 7 before the same event can start again")
{
    const TemperatureEventEngine engine(WeatherTables::Default());

    ScriptedRandomSource none;
    const TemperatureResult blocked = engine.resolve(Day(2, {}, Cooldowns{6, 99}), none);
    CHECK(blocked.started == EventKind::None);
    CHECK(blocked.cooldowns.daysSinceColdFront == 7);
    CHECK(blocked.actualTemperature == kBase - 10);

    ScriptedRandomSource rng{1};
    const TemperatureResult allowed = engine.resolve(Day(2, {}, blocked.cooldowns), rng);
    CHECK(allowed.started == EventKind::ColdFront);
    CHECK(allowed.event.coldFront.total == 1);
    CHECK(allowed.cooldowns.daysSinceColdFront == 0);
    // A one-day front is both first and last; the first-day text wins.
    CHECK(Contains(allowed.description, "Cold Front: Day 1 of 1 - Sky filled"));
}

TEST_CASE("Heat wave starts on 99 with 10 + d10 days")
{
    const TemperatureEventEngine engine(WeatherTables::Default());

    ScriptedRandomSource rng{7};
    const TemperatureResult r = engine.resolve(Day(99), rng);
    CHECK(r.started == EventKind::HeatWave);
    CHECK(r.event.heatWave.remaining == 17);
    CHECK(r.event.heatWave.total == 17);
    CHECK(r.cooldowns.daysSinceHeatWave == 0);
    CHECK(r.cooldowns.daysSinceColdFront == 99);
    CHECK(r.actualTemperature == kBase + 15);
    CHECK(Contains(r.description, "Heat Wave: Day 1 of 17"));

    SUBCASE("variation during a heat wave is held to +/-5") {
        ScriptedRandomSource none;
        const TemperatureResult hot = engine.resolve(Day(100, r.event, r.cooldowns), none);
        CHECK(hot.actualTemperature == kBase + 15);
        CHECK(hot.category == TemperatureCategory::ExtremelyHigh);

        const TemperatureResult cold = engine.resolve(Day(1, r.event, r.cooldowns), none);
        CHECK(cold.actualTemperature == kBase + 5);
        CHECK(cold.category == TemperatureCategory::Warm);
    }
    SUBCASE("a cold front cannot start during a heat wave") {
        ScriptedRandomSource none;
        const TemperatureResult next = engine.resolve(Day(2, r.event, r.cooldowns), none);
        CHECK(next.suppressed);
        CHECK_FALSE(next.event.coldFront.active());
        CHECK(next.event.heatWave.remaining == 16);
        CHECK(next.cooldowns.daysSinceColdFront == 99);
    }
}

TEST_CASE("Category comes from the final temperature, not the roll's row")
{
    const TemperatureEventEngine engine(WeatherTables::Default());
    ScriptedRandomSource none;

    const TemperatureResult calm = engine.resolve(Day(50), none);
    CHECK(calm.actualTemperature == kBase);
    CHECK(calm.category == TemperatureCategory::Average);
    CHECK(calm.bucket == VariationBucket::Average);

    EventState front;
    front.coldFront = {2, 4};
    const TemperatureResult chilled = engine.resolve(Day(50, front, Cooldowns{0, 99}), none);
    CHECK(chilled.bucket == VariationBucket::Average);
    CHECK(chilled.category == TemperatureCategory::VeryLow);
    CHECK(chilled.category != calm.category);
}

TEST_CASE("Malformed rolls resolve to the average row and never trigger")
{
    const TemperatureEventEngine engine(WeatherTables::Default());

    for (int roll : {0, -5, 101, 1000}) {
        CAPTURE(roll);
        ScriptedRandomSource none;
        TemperatureResult r;
        CHECK_NOTHROW(r = engine.resolve(Day(roll), none));
        CHECK(r.started == EventKind::None);
        CHECK(r.actualTemperature == kBase);
        CHECK(r.bucket == VariationBucket::Average);
        CHECK(r.roll == roll);
        CHECK(none.consumed() == 0);
    }

    // Same input twice gives the same answer.
    ScriptedRandomSource a, b;
    const TemperatureResult r1 = engine.resolve(Day(150, {}, Cooldowns{7, 7}), a);
    const TemperatureResult r2 = engine.resolve(Day(150, {}, Cooldowns{7, 7}), b);
    CHECK(r1.actualTemperature == r2.actualTemperature);
    CHECK(r1.event == r2.event);
    CHECK(r1.cooldowns == r2.cooldowns);
}

TEST_CASE("Impossible incoming states raise InvariantViolation")
{
    const TemperatureEventEngine engine(WeatherTables::Default());
    ScriptedRandomSource none;

    EventState both;
    both.coldFront = {2, 3};
    both.heatWave  = {5, 12};
    CHECK_THROWS_AS((void)engine.resolve(Day(50, both), none), InvariantViolation);

    EventState over;
    over.coldFront = {4, 3};
    CHECK_THROWS_AS((void)engine.resolve(Day(50, over), none), InvariantViolation);

    EventState longFront;
    longFront.coldFront = {6, 6};
    CHECK_THROWS_AS((void)engine.resolve(Day(50, longFront), none), InvariantViolation);

    EventState shortWave;
    shortWave.heatWave = {3, 5};
    CHECK_THROWS_AS((void)engine.resolve(Day(50, shortWave), none), InvariantViolation);

    CHECK_THROWS_AS((void)engine.resolve(Day(50, {}, Cooldowns{-1, 99}), none), InvariantViolation);
}

TEST_CASE("Unknown region is a ConfigurationError before anything else")
{
    const TemperatureEventEngine engine(WeatherTables::Default());
    ScriptedRandomSource none;

    TemperatureInput in = Day(2);
    in.region = static_cast<Region>(99);
    CHECK_THROWS_AS((void)engine.resolve(in, none), ConfigurationError);
    CHECK(none.consumed() == 0);
}

TEST_CASE("Long random run keeps the event invariants")
{
    const TemperatureEventEngine engine(WeatherTables::Default());
    rng::PcgRandomSource rng(20240601);

    EventState state;
    Cooldowns cd;
    int coldStarts = 0;
    int heatStarts = 0;

    for (int day = 0; day < 20000; ++day) {
        // Push the trigger values often so events actually happen.
        int roll = rng.d100();
        if (roll % 7 == 0) roll = (roll % 2 == 0) ? 2 : 99;

        const Cooldowns before = cd;
        const TemperatureResult r = engine.resolve(Day(roll, state, cd), rng);

        CHECK_FALSE((r.event.coldFront.active() && r.event.heatWave.active()));
        if (r.started == EventKind::ColdFront) {
            ++coldStarts;
            CHECK(before.daysSinceColdFront >= 7);
            CHECK(r.event.coldFront.total >= 1);
            CHECK(r.event.coldFront.total <= 5);
        }
        if (r.started == EventKind::HeatWave) {
            ++heatStarts;
            CHECK(before.daysSinceHeatWave >= 7);
            CHECK(r.event.heatWave.total >= 11);
            CHECK(r.event.heatWave.total <= 20);
        }
        if (state.activeKind() != EventKind::None)
            CHECK(r.started == EventKind::None);

        state = r.event;
        cd    = r.cooldowns;
    }

    CHECK(coldStarts > 0);
    CHECK(heatStarts > 0);
}
