#pragma once
// include/voyage/journey/JourneyService.hpp
//
// Journey lifecycle around the orchestrator: start/restart, end, stage
// settings and cooldown status.

#include "voyage/journey/Journey.hpp"
#include "voyage/journey/JourneyStore.hpp"

#include <optional>
#include <string>

namespace voyage::journey {

struct JourneyOptions {
    int         stageDuration = kDefaultStageDays;
    DisplayMode displayMode   = DisplayMode::Simple;
};

struct EventReadiness {
    weather::EventKind kind          = weather::EventKind::None;
    int                daysSince     = weather::CooldownTracker::kNever;
    bool               active        = false;   // running into the next day
    bool               ready         = true;    // may trigger on the next day
    int                daysUntilReady = 0;
    weather::EventProgress progress;
};

struct CooldownStatus {
    int            nextDay = 1;
    EventReadiness coldFront;
    EventReadiness heatWave;
};

class JourneyService {
public:
    explicit JourneyService(JourneyStore& store) : m_store(store) {}

    // Creates a fresh journey at day 1. An existing journey under the same
    // key is ended first and its days are erased.
    JourneyState start(const std::string& key, weather::Region region, weather::Season season,
                       const JourneyOptions& options = {});

    // Throws JourneyNotFound when there is nothing to end.
    void end(const std::string& key);

    [[nodiscard]] JourneyState state(const std::string& key);
    [[nodiscard]] bool exists(const std::string& key);

    // Either argument may be omitted. Stage duration outside [1,10] throws
    // ConfigurationError and nothing is written.
    JourneyState configure(const std::string& key, std::optional<int> stageDuration,
                           std::optional<DisplayMode> displayMode);

    [[nodiscard]] CooldownStatus cooldowns(const std::string& key);

    // Whether `kind` may trigger on the journey's next day.
    [[nodiscard]] bool canTrigger(const std::string& key, weather::EventKind kind);

private:
    JourneyStore& m_store;
};

} // namespace voyage::journey
