// src/voyage/journey/JourneyService.cpp
#include "voyage/journey/JourneyService.hpp"
#include "voyage/journey/JourneyJson.hpp"
#include "voyage/core/Errors.hpp"
#include "voyage/core/Log.hpp"

namespace voyage::journey {

using namespace voyage::weather;

namespace {

EventReadiness Readiness(EventKind kind, const JourneyState& s)
{
    const CooldownTracker tracker(s.cooldowns);

    EventReadiness r;
    r.kind      = kind;
    r.daysSince = tracker.daysSince(kind);
    r.progress  = kind == EventKind::ColdFront ? s.event.coldFront : s.event.heatWave;
    r.active    = r.progress.active();
    // Triggers are ignored while either event runs.
    r.ready          = tracker.ready(kind) && s.event.activeKind() == EventKind::None;
    r.daysUntilReady = tracker.daysUntilReady(kind);
    return r;
}

} // namespace

JourneyState JourneyService::start(const std::string& key, Region region, Season season,
                                   const JourneyOptions& options)
{
    ValidateJourneyKey(key);
    ValidateStageDuration(options.stageDuration);

    if (m_store.eraseJourney(key))
        logsys::get()->info("journey {}: previous journey ended by restart", key);

    JourneyState s;
    s.region        = region;
    s.season        = season;
    s.stageDuration = options.stageDuration;
    s.displayMode   = options.displayMode;
    s.startedUtc    = NowUtcIso8601();
    m_store.saveJourney(key, s);

    logsys::get()->info("journey {}: started in {} ({})", key, ToKey(region), ToKey(season));
    return s;
}

void JourneyService::end(const std::string& key)
{
    if (!m_store.eraseJourney(key)) throw JourneyNotFound(key);
    logsys::get()->info("journey {}: ended", key);
}

JourneyState JourneyService::state(const std::string& key)
{
    auto s = m_store.loadJourney(key);
    if (!s) throw JourneyNotFound(key);
    return *s;
}

bool JourneyService::exists(const std::string& key)
{
    return m_store.loadJourney(key).has_value();
}

JourneyState JourneyService::configure(const std::string& key, std::optional<int> stageDuration,
                                       std::optional<DisplayMode> displayMode)
{
    if (stageDuration) ValidateStageDuration(*stageDuration);

    JourneyState s = state(key);
    if (stageDuration) s.stageDuration = *stageDuration;
    if (displayMode)   s.displayMode = *displayMode;
    m_store.saveJourney(key, s);

    logsys::get()->info("journey {}: stage duration {} day(s), {} display", key, s.stageDuration,
                        ToKey(s.displayMode));
    return s;
}

CooldownStatus JourneyService::cooldowns(const std::string& key)
{
    const JourneyState s = state(key);
    CooldownStatus out;
    out.nextDay   = s.currentDay;
    out.coldFront = Readiness(EventKind::ColdFront, s);
    out.heatWave  = Readiness(EventKind::HeatWave, s);
    return out;
}

bool JourneyService::canTrigger(const std::string& key, EventKind kind)
{
    const CooldownStatus st = cooldowns(key);
    switch (kind) {
    case EventKind::ColdFront: return st.coldFront.ready;
    case EventKind::HeatWave:  return st.heatWave.ready;
    case EventKind::None:      break;
    }
    return false;
}

} // namespace voyage::journey
