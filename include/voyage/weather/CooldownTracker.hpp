#pragma once
// include/voyage/weather/CooldownTracker.hpp
//
// Days-since-last counters for cold fronts and heat waves. A counter is reset
// to 0 when its event starts, held at 0 while the event runs, and counts up
// again from the day after it ends. An event may only start once its counter
// has reached kCooldownDays. 99 means "never happened".

#include <algorithm>
#include <cstdint>

namespace voyage::weather {

enum class EventKind : std::uint8_t {
    None = 0,
    ColdFront,
    HeatWave,
};

[[nodiscard]] inline const char* ToKey(EventKind k) noexcept
{
    switch (k) {
    case EventKind::ColdFront: return "cold_front";
    case EventKind::HeatWave:  return "heat_wave";
    case EventKind::None:      break;
    }
    return "none";
}

struct Cooldowns {
    int daysSinceColdFront = 99;
    int daysSinceHeatWave  = 99;

    friend bool operator==(const Cooldowns&, const Cooldowns&) = default;
};

class CooldownTracker {
public:
    static constexpr int kCooldownDays = 7;
    static constexpr int kNever        = 99;

    CooldownTracker() = default;
    explicit CooldownTracker(const Cooldowns& c) : m_counters(c) {}

    [[nodiscard]] int daysSince(EventKind k) const noexcept
    {
        switch (k) {
        case EventKind::ColdFront: return m_counters.daysSinceColdFront;
        case EventKind::HeatWave:  return m_counters.daysSinceHeatWave;
        case EventKind::None:      break;
        }
        return kNever;
    }

    [[nodiscard]] bool ready(EventKind k) const noexcept { return daysSince(k) >= kCooldownDays; }
    [[nodiscard]] bool onCooldown(EventKind k) const noexcept { return !ready(k); }

    // Days still to wait before `k` may trigger again (0 when ready).
    [[nodiscard]] int daysUntilReady(EventKind k) const noexcept
    {
        return std::max(0, kCooldownDays - daysSince(k));
    }

    // End-of-day update: held at 0 while the event carries on into tomorrow,
    // otherwise one more day since it last ran (saturating at kNever).
    void advance(EventKind k, bool held) noexcept
    {
        int* c = counter(k);
        if (!c) return;
        *c = held ? 0 : std::min(*c + 1, kNever);
    }

    [[nodiscard]] const Cooldowns& counters() const noexcept { return m_counters; }

private:
    int* counter(EventKind k) noexcept
    {
        switch (k) {
        case EventKind::ColdFront: return &m_counters.daysSinceColdFront;
        case EventKind::HeatWave:  return &m_counters.daysSinceHeatWave;
        case EventKind::None:      break;
        }
        return nullptr;
    }

    Cooldowns m_counters;
};

} // namespace voyage::weather
