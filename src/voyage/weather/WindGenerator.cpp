// src/voyage/weather/WindGenerator.cpp
#include "voyage/weather/WindGenerator.hpp"

namespace voyage::weather {

namespace {
constexpr int kChangeRoll = 1;
}

WindState WindGenerator::step(const WindState& current, rng::RandomSource& rng, bool& changed)
{
    changed = false;
    if (rng.d10() != kChangeRoll)
        return current;

    changed = true;
    WindState next = current;

    const bool stronger = rng.coin() == 1;
    if (current.strength == WindStrength::VeryStrong)
        next.strength = WindStrength::Strong;
    else if (current.strength == WindStrength::Calm)
        next.strength = WindStrength::Light;
    else
    {
        const int s = static_cast<int>(current.strength) + (stronger ? 1 : -1);
        next.strength = static_cast<WindStrength>(s);
    }

    if (rng.coin() == 1)
        next.direction = WindDirectionFromD10(rng.d10());

    return next;
}

WindReading WindGenerator::annotate(TimeOfDay period, const WindState& s, bool changed) const
{
    const WindModifiers& mods = m_tables.windModifiers(s.strength, s.direction);

    WindReading r;
    r.period          = period;
    r.strength        = s.strength;
    r.direction       = s.direction;
    r.speedPct        = mods.speedPct;
    r.handlingPenalty = mods.handlingPenalty;
    r.requiresTacking = mods.requiresTacking;
    r.changed         = changed;
    return r;
}

WindTimeline WindGenerator::generateDay(const std::optional<WindState>& previous,
                                        rng::RandomSource& rng) const
{
    WindTimeline out{};

    WindState current;
    std::size_t first = 0;
    if (!previous)
    {
        // Strength is rolled before direction.
        const int strengthRoll  = rng.d10();
        const int directionRoll = rng.d10();
        current = {WindStrengthFromD10(strengthRoll), WindDirectionFromD10(directionRoll)};
        out[0] = annotate(TimeOfDay::Dawn, current, false);
        first = 1;
    }
    else
    {
        current = *previous;
    }

    for (std::size_t i = first; i < kPeriodsPerDay; ++i)
    {
        bool changed = false;
        current = step(current, rng, changed);
        out[i] = annotate(static_cast<TimeOfDay>(i), current, changed);
    }
    return out;
}

WindStrength MostCommonStrength(const WindTimeline& timeline) noexcept
{
    std::array<int, kWindStrengthCount> counts{};
    for (const WindReading& r : timeline)
        ++counts[static_cast<std::size_t>(r.strength)];

    std::size_t best = 0;
    for (std::size_t i = 1; i < kWindStrengthCount; ++i)
    {
        if (counts[i] >= counts[best]) best = i;
    }
    return static_cast<WindStrength>(best);
}

} // namespace voyage::weather
