// src/voyage/weather/WeatherTables.cpp
#include "voyage/weather/WeatherTables.hpp"
#include "voyage/core/Errors.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace voyage::weather {

namespace {

constexpr const char* kTackingNote =
    "The movement increase can only be achieved by tacking, which requires a successful Boat Handling Test";
constexpr const char* kCalmNote =
    "Boat drifts downstream at 25% of its normal movement rate; Boat Handling Tests are made with a penalty of -10";
constexpr const char* kGaleSideNote =
    "A successful Boat Handling Test must be made to take the sail down before the boat keels over. "
    "On a failure the sail and rigging are torn down and the boat takes on water; it may be righted with "
    "a Boat Handling Test each turn (cumulative -5 per failed Test) and sinks in Toughness x 10 turns otherwise";
constexpr const char* kGaleHeadNote =
    "A successful Boat Handling Test is required to avoid damage to the sail and rigging; on a failure treat it "
    "as a Critical Hit to the rigging. The boat drifts out of control at 25% of its normal movement rate and "
    "Boat Handling Tests to steer are made at -25";

std::size_t Index(Region r)
{
    const auto i = static_cast<std::size_t>(r);
    if (i >= kRegionCount)
        throw ConfigurationError("region index " + std::to_string(i) + " is out of range");
    return i;
}

std::size_t Index(Season s)
{
    const auto i = static_cast<std::size_t>(s);
    if (i >= kSeasonCount)
        throw ConfigurationError("season index " + std::to_string(i) + " is out of range");
    return i;
}

// Ranges must be sorted, contiguous and span exactly 1..100.
template <typename Range>
void ValidateD100(std::vector<Range> ranges, const std::string& what)
{
    if (ranges.empty())
        throw ConfigurationError(what + ": table is empty");

    std::sort(ranges.begin(), ranges.end(),
              [](const Range& a, const Range& b) { return a.lo < b.lo; });

    int expected = kD100Min;
    for (const Range& r : ranges) {
        if (r.lo > r.hi)
            throw ConfigurationError(what + ": range " + std::to_string(r.lo) + "-" +
                                     std::to_string(r.hi) + " is inverted");
        if (r.lo != expected)
            throw ConfigurationError(what + ": roll " + std::to_string(expected) +
                                     (r.lo > expected ? " is not covered" : " is covered twice"));
        expected = r.hi + 1;
    }
    if (expected != kD100Max + 1)
        throw ConfigurationError(what + ": rolls " + std::to_string(expected) + "-100 are not covered");
}

} // namespace

WindStrength WindStrengthFromD10(int roll) noexcept
{
    if (roll <= 2) return WindStrength::Calm;
    if (roll <= 4) return WindStrength::Light;
    if (roll <= 6) return WindStrength::Bracing;
    if (roll <= 8) return WindStrength::Strong;
    return WindStrength::VeryStrong;
}

WindDirection WindDirectionFromD10(int roll) noexcept
{
    if (roll <= 3) return WindDirection::Tailwind;
    if (roll <= 7) return WindDirection::Sidewind;
    return WindDirection::Headwind;
}

WeatherTables::WeatherTables(WeatherTableData data)
    : m_data(std::move(data))
{
    for (std::size_t s = 0; s < kSeasonCount; ++s)
        ValidateD100(m_data.weather[s], std::string("weather table for ") + ToKey(static_cast<Season>(s)));
    ValidateD100(m_data.variation, "temperature variation table");
}

WeatherTableData WeatherTables::DefaultData()
{
    WeatherTableData d;

    //                      spring summer autumn winter
    d.baseTemperature = {{
        {{  9, 21, 11,  0 }},   // reikland
        {{  7, 19, 10, -1 }},   // nordland
        {{  8, 21, 10, -2 }},   // ostland
        {{  7, 21, 14, -2 }},   // middenland
        {{  9, 23, 12, -2 }},   // hochland
        {{ 10, 22, 13, -2 }},   // talabecland
        {{  6, 19, 13, -4 }},   // ostermark
        {{  7, 23, 15,  4 }},   // stirland
        {{  6, 20, 12, -2 }},   // sylvania
        {{  7, 20, 11, -2 }},   // wissenland
        {{ 11, 22, 13, -1 }},   // averland
        {{  9, 21, 12, -1 }},   // solland
        {{ -1, 15,  7, -7 }},   // kislev
        {{  9, 19, 12,  6 }},   // wasteland
        {{  8, 21, 11,  3 }},   // border princes
    }};

    using W = WeatherType;
    d.weather[static_cast<std::size_t>(Season::Spring)] = {
        {1, 10, W::Dry}, {11, 30, W::Fair}, {31, 90, W::Rain}, {91, 95, W::Downpour}, {96, 100, W::Snow}};
    d.weather[static_cast<std::size_t>(Season::Summer)] = {
        {1, 40, W::Dry}, {41, 70, W::Fair}, {71, 95, W::Rain}, {96, 100, W::Downpour}};
    d.weather[static_cast<std::size_t>(Season::Autumn)] = {
        {1, 30, W::Dry}, {31, 60, W::Fair}, {61, 90, W::Rain}, {91, 98, W::Downpour}, {99, 100, W::Snow}};
    d.weather[static_cast<std::size_t>(Season::Winter)] = {
        {1, 10, W::Fair}, {11, 60, W::Rain}, {61, 65, W::Downpour}, {66, 90, W::Snow}, {91, 100, W::Blizzard}};

    using B = VariationBucket;
    d.variation = {
        {1, 1, B::ExtremelyLow, -15},
        {2, 2, B::ColdFront, -10},
        {3, 10, B::VeryLow, -10},
        {11, 25, B::Low, -5},
        {26, 75, B::Average, 0},
        {76, 90, B::High, 5},
        {91, 98, B::VeryHigh, 10},
        {99, 99, B::HeatWave, 10},
        {100, 100, B::ExtremelyHigh, 15},
    };

    //            speed  handling  tacking  notes
    const WindModifiers calm{-75, -10, false, kCalmNote};
    d.wind = {{
        {{ calm, calm, calm }},
        {{ {  5,   0, true,  kTackingNote }, {   0,   0, false, "No modifier" }, {  -5,   0, false, "" } }},
        {{ { 10,   0, true,  kTackingNote }, {   5,   0, true,  kTackingNote  }, { -10,   0, false, "" } }},
        {{ { 20,   0, true,  kTackingNote }, {  10,   0, true,  kTackingNote  }, { -20,   0, false, "" } }},
        {{ { 25,   0, true,  kTackingNote }, {   0,   0, false, kGaleSideNote }, { -25, -25, false, kGaleHeadNote } }},
    }};

    d.effects[static_cast<std::size_t>(W::Dry)] = {
        "Dry",
        "Prolonged dry weather sends curtains of dust across the banks at the slightest breeze, "
        "obscuring vision and parching throats. Travel is easy, if uncomfortable.",
        {"-10 penalty to Forage Endeavours"}};
    d.effects[static_cast<std::size_t>(W::Fair)] = {
        "Fair",
        "For once, the weather is being kind. Clear skies and comfortable conditions.",
        {"No weather-related hazards"}};
    d.effects[static_cast<std::size_t>(W::Rain)] = {
        "Rain",
        "Rain can last anywhere from a few hours to a few days. It reduces visibility and makes ranged combat more difficult.",
        {"Visibility reduced to 75 ft or less",
         "-10 penalty to ranged weapons due to driving wind and rain"}};
    d.effects[static_cast<std::size_t>(W::Downpour)] = {
        "Downpour",
        "Terrible storms reduce visibility to near zero, making any sound below a shout impossible to hear. "
        "Everything and everyone not under cover is soaked through within minutes.",
        {"Visibility reduced to near zero",
         "-10 penalty on all physical Tests",
         "-20 penalty to ranged weapons",
         "Exposed gunpowder is immediately ruined",
         "Animals with the Skittish Trait may become spooked by lightning"}};
    d.effects[static_cast<std::size_t>(W::Snow)] = {
        "Snow",
        "A gentle snow covers the world in a blanket of white. It is undoubtedly beautiful, until one has to move through it.",
        {"Visibility reduced to 150 ft",
         "Movement faster than Walking impossible",
         "Average (+20) Endurance Test or gain a Fatigued Condition"}};
    d.effects[static_cast<std::size_t>(W::Blizzard)] = {
        "Blizzard",
        "Howling winds drive snow into every crevice. Visibility is nearly zero and exposed skin freezes quickly.",
        {"Visibility reduced to near zero",
         "Movement faster than Walking impossible",
         "Challenging (+0) Endurance Test or gain a Fatigued Condition",
         "-10 penalty on all physical Tests",
         "Animals with the Skittish Trait may panic"}};

    return d;
}

const WeatherTables& WeatherTables::Default()
{
    static const WeatherTables tables(DefaultData());
    return tables;
}

void WeatherTables::validate(Region region, Season season) const
{
    static_cast<void>(Index(region));
    static_cast<void>(Index(season));
}

int WeatherTables::baseTemperature(Region region, Season season) const
{
    return m_data.baseTemperature[Index(region)][Index(season)];
}

int WeatherTables::baseTemperature(std::string_view region, std::string_view season) const
{
    return baseTemperature(ParseRegion(region), ParseSeason(season));
}

WeatherType WeatherTables::weatherType(Season season, int roll) const
{
    for (const WeatherRange& r : m_data.weather[Index(season)]) {
        if (roll >= r.lo && roll <= r.hi) return r.type;
    }
    throw ConfigurationError("weather roll " + std::to_string(roll) + " is outside 1-100");
}

const WindModifiers& WeatherTables::windModifiers(WindStrength strength, WindDirection direction) const
{
    const auto s = static_cast<std::size_t>(strength);
    const auto d = static_cast<std::size_t>(direction);
    if (s >= kWindStrengthCount || d >= kWindDirectionCount)
        throw ConfigurationError("wind strength/direction index is out of range");
    return m_data.wind[s][d];
}

TemperatureVariation WeatherTables::temperatureVariation(int roll) const
{
    for (const VariationRange& r : m_data.variation) {
        if (roll >= r.lo && roll <= r.hi) return {r.bucket, r.delta};
    }
    throw ConfigurationError("temperature roll " + std::to_string(roll) + " is outside 1-100");
}

const WeatherEffects& WeatherTables::effects(WeatherType type) const
{
    const auto i = static_cast<std::size_t>(type);
    if (i >= kWeatherTypeCount)
        throw ConfigurationError("weather type index " + std::to_string(i) + " is out of range");
    return m_data.effects[i];
}

TemperatureCategory CategorizeTemperature(int diff) noexcept
{
    using C = TemperatureCategory;
    if (diff <= -15) return C::ExtremelyLow;
    if (diff <= -10) return C::VeryLow;
    if (diff <= -6)  return C::Low;
    if (diff <= -3)  return C::Cool;
    if (diff <= 2)   return C::Average;
    if (diff <= 5)   return C::Warm;
    if (diff <= 9)   return C::High;
    if (diff <= 14)  return C::VeryHigh;
    return C::ExtremelyHigh;
}

std::string_view CategoryDescription(TemperatureCategory category) noexcept
{
    switch (category) {
    case TemperatureCategory::ExtremelyLow:  return "Extremely low: More than 15 degrees colder than average";
    case TemperatureCategory::VeryLow:       return "Very low: About 10 degrees colder than average";
    case TemperatureCategory::Low:           return "Low: About 5 degrees colder than average";
    case TemperatureCategory::Cool:          return "Cool: A few degrees colder than average";
    case TemperatureCategory::Average:       return "Average for month and region";
    case TemperatureCategory::Warm:          return "Warm: A few degrees warmer than average";
    case TemperatureCategory::High:          return "High: About 5 degrees warmer than average";
    case TemperatureCategory::VeryHigh:      return "Very high: About 10 degrees warmer than average";
    case TemperatureCategory::ExtremelyHigh: return "Extremely high: More than 15 degrees warmer than average";
    }
    return "Average for month and region";
}

std::string_view RelativeFeel(int diff) noexcept
{
    if (diff <= -15) return "Dangerously cold";
    if (diff <= -10) return "Very cold for the season";
    if (diff <= -5)  return "Cooler than average";
    if (diff <= -2)  return "Slightly cool";
    if (diff >= 15)  return "Dangerously hot";
    if (diff >= 10)  return "Very warm for the season";
    if (diff >= 5)   return "Warmer than average";
    if (diff >= 2)   return "Slightly warm";
    return "Comfortable for the season";
}

int WindChill(WindStrength strength) noexcept
{
    switch (strength) {
    case WindStrength::Light:
    case WindStrength::Bracing:
        return -5;
    case WindStrength::Strong:
    case WindStrength::VeryStrong:
        return -10;
    case WindStrength::Calm:
        break;
    }
    return 0;
}

} // namespace voyage::weather
