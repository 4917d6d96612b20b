// src/voyage/weather/TemperatureEvents.cpp
#include "voyage/weather/TemperatureEvents.hpp"
#include "voyage/core/Errors.hpp"
#include "voyage/core/Log.hpp"

#include <algorithm>
#include <string>

namespace voyage::weather {

namespace {

void CheckProgress(const EventProgress& p, int minTotal, int maxTotal, const char* what)
{
    if (p.remaining < 0 || p.total < 0)
        throw InvariantViolation(std::string(what) + ": negative remaining/total (" +
                                 std::to_string(p.remaining) + "/" + std::to_string(p.total) + ")");
    if (p.total > maxTotal)
        throw InvariantViolation(std::string(what) + ": total " + std::to_string(p.total) +
                                 " exceeds " + std::to_string(maxTotal));
    if (p.remaining > p.total)
        throw InvariantViolation(std::string(what) + ": remaining " + std::to_string(p.remaining) +
                                 " exceeds total " + std::to_string(p.total));
    if (p.active() && p.total < minTotal)
        throw InvariantViolation(std::string(what) + ": total " + std::to_string(p.total) +
                                 " is below " + std::to_string(minTotal));
}

// Tomorrow's remaining count for one event type.
EventProgress Carry(const EventProgress& in, bool startedToday, int duration)
{
    if (startedToday) return {duration, duration};
    if (in.active())  return {in.remaining - 1, in.total};
    return {};
}

} // namespace

void TemperatureEventEngine::validate(const EventState& state, const Cooldowns& cooldowns)
{
    CheckProgress(state.coldFront, kColdFrontMinDays, kColdFrontMaxDays, "cold front");
    CheckProgress(state.heatWave, kHeatWaveMinDays, kHeatWaveMaxDays, "heat wave");

    if (state.coldFront.active() && state.heatWave.active())
        throw InvariantViolation("cold front and heat wave are both active");

    if (cooldowns.daysSinceColdFront < 0 || cooldowns.daysSinceHeatWave < 0)
        throw InvariantViolation("cooldown counters must not be negative");
}

TemperatureResult TemperatureEventEngine::resolve(const TemperatureInput& in, rng::RandomSource& rng) const
{
    const int base = m_tables.baseTemperature(in.region, in.season);
    validate(in.previous, in.cooldowns);

    TemperatureResult out;
    out.roll            = in.roll;
    out.baseTemperature = base;

    TemperatureVariation variation;
    const bool wellFormed = IsD100(in.roll);
    if (wellFormed)
        variation = m_tables.temperatureVariation(in.roll);
    else
        logsys::get()->warn("temperature roll {} is outside 1-100; using the average row", in.roll);
    out.bucket = variation.bucket;

    const bool coldActive = in.previous.coldFront.active();
    const bool heatActive = in.previous.heatWave.active();
    const CooldownTracker before(in.cooldowns);

    int coldDuration = 0;
    int heatDuration = 0;
    if (coldActive || heatActive)
    {
        out.suppressed = in.roll == kColdFrontTriggerRoll || in.roll == kHeatWaveTriggerRoll;
    }
    else if (wellFormed)
    {
        if (in.roll == kColdFrontTriggerRoll && before.ready(EventKind::ColdFront))
        {
            coldDuration = rng.uniform(kColdFrontMinDays, kColdFrontMaxDays);
            out.started  = EventKind::ColdFront;
        }
        else if (in.roll == kHeatWaveTriggerRoll && before.ready(EventKind::HeatWave))
        {
            heatDuration = kHeatWaveBaseDays + rng.uniform(1, kHeatWaveMaxDays - kHeatWaveBaseDays);
            out.started  = EventKind::HeatWave;
        }
    }

    out.event.coldFront = Carry(in.previous.coldFront, out.started == EventKind::ColdFront, coldDuration);
    out.event.heatWave  = Carry(in.previous.heatWave, out.started == EventKind::HeatWave, heatDuration);

    CooldownTracker after(in.cooldowns);
    after.advance(EventKind::ColdFront, out.event.coldFront.active());
    after.advance(EventKind::HeatWave, out.event.heatWave.active());
    out.cooldowns = after.counters();

    // Today's modifier: an event that started today or was still running coming in.
    int modifier = 0;
    if (coldActive || out.started == EventKind::ColdFront)
        modifier = kColdFrontModifier;
    else if (heatActive || out.started == EventKind::HeatWave)
        modifier = kHeatWaveModifier;

    if (modifier != 0)
        out.actualTemperature = base + modifier +
                                std::clamp(variation.delta, -kEventVariationLimit, kEventVariationLimit);
    else
        out.actualTemperature = base + variation.delta;

    out.category    = CategorizeTemperature(out.actualTemperature - base);
    out.description = std::string(CategoryDescription(out.category));

    if (out.event.coldFront.active())
        out.description += "\n" + EventProgressLine(EventKind::ColdFront, out.event.coldFront);
    if (out.event.heatWave.active())
        out.description += "\n" + EventProgressLine(EventKind::HeatWave, out.event.heatWave);

    if (coldActive && !out.event.coldFront.active())
        out.ended = EventKind::ColdFront;
    else if (heatActive && !out.event.heatWave.active())
        out.ended = EventKind::HeatWave;

    if (out.started != EventKind::None)
    {
        const EventProgress& p = out.started == EventKind::ColdFront ? out.event.coldFront : out.event.heatWave;
        logsys::get()->info("{} begins in {} ({}), {} day(s)", ToKey(out.started),
                            ToKey(in.region), ToKey(in.season), p.total);
    }
    if (out.ended != EventKind::None)
        logsys::get()->info("{} has passed in {}", ToKey(out.ended), ToKey(in.region));
    if (out.suppressed)
        logsys::get()->debug("trigger roll {} ignored while an event is running", in.roll);

    return out;
}

std::string EventProgressLine(EventKind kind, const EventProgress& outgoing)
{
    if (kind == EventKind::None || !outgoing.active()) return {};

    const int elapsed = outgoing.total - outgoing.remaining + 1;
    std::string line = kind == EventKind::ColdFront ? "Cold Front" : "Heat Wave";
    line += ": Day " + std::to_string(elapsed) + " of " + std::to_string(outgoing.total);

    if (elapsed == 1 && kind == EventKind::ColdFront)
        line += " - Sky filled with flocks of emigrating birds";
    else if (elapsed > 1 && outgoing.remaining == 1)
        line += " (Final Day)";
    return line;
}

} // namespace voyage::weather
