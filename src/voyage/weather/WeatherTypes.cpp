// src/voyage/weather/WeatherTypes.cpp
#include "voyage/weather/WeatherTypes.hpp"
#include "voyage/core/Errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace voyage::weather {

namespace {

constexpr std::array<const char*, kSeasonCount> kSeasonKeys{
    "spring", "summer", "autumn", "winter"};

constexpr std::array<const char*, kRegionCount> kRegionKeys{
    "reikland", "nordland", "ostland", "middenland", "hochland",
    "talabecland", "ostermark", "stirland", "sylvania", "wissenland",
    "averland", "solland", "kislev", "wasteland", "border_princes"};

constexpr std::array<const char*, kWindStrengthCount> kStrengthKeys{
    "calm", "light", "bracing", "strong", "very_strong"};

constexpr std::array<const char*, kWindDirectionCount> kDirectionKeys{
    "tailwind", "sidewind", "headwind"};

constexpr std::array<const char*, kWeatherTypeCount> kWeatherKeys{
    "dry", "fair", "rain", "downpour", "snow", "blizzard"};

constexpr std::array<const char*, 9> kBucketKeys{
    "extremely_low", "cold_front", "very_low", "low", "average",
    "high", "very_high", "heat_wave", "extremely_high"};

constexpr std::array<const char*, 9> kCategoryKeys{
    "extremely_low", "very_low", "low", "cool", "average",
    "warm", "high", "very_high", "extremely_high"};

constexpr std::array<const char*, kPeriodsPerDay> kTimeKeys{
    "dawn", "midday", "dusk", "midnight"};

template <typename Enum, std::size_t N>
const char* KeyOf(const std::array<const char*, N>& keys, Enum e) noexcept
{
    const auto i = static_cast<std::size_t>(e);
    return i < N ? keys[i] : "unknown";
}

std::string Normalize(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        const auto uc = static_cast<unsigned char>(c);
        if (c == ' ' || c == '-') out.push_back('_');
        else out.push_back(static_cast<char>(std::tolower(uc)));
    }
    // trim underscores left over from surrounding whitespace
    const auto first = out.find_first_not_of('_');
    if (first == std::string::npos) return {};
    const auto last = out.find_last_not_of('_');
    return out.substr(first, last - first + 1);
}

template <typename Enum, std::size_t N>
Enum ParseKey(const std::array<const char*, N>& keys, std::string_view text, const char* what)
{
    const std::string norm = Normalize(text);
    for (std::size_t i = 0; i < N; ++i) {
        if (norm == keys[i]) return static_cast<Enum>(i);
    }
    throw ConfigurationError(std::string("unknown ") + what + " '" + std::string(text) + "'");
}

// "border_princes" -> "Border Princes"
std::string Titled(const char* key)
{
    std::string out(key);
    bool upper = true;
    for (char& c : out) {
        if (c == '_') { c = ' '; upper = true; continue; }
        if (upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        upper = false;
    }
    return out;
}

} // namespace

const char* ToKey(Season s) noexcept              { return KeyOf(kSeasonKeys, s); }
const char* ToKey(Region r) noexcept              { return KeyOf(kRegionKeys, r); }
const char* ToKey(WindStrength s) noexcept        { return KeyOf(kStrengthKeys, s); }
const char* ToKey(WindDirection d) noexcept       { return KeyOf(kDirectionKeys, d); }
const char* ToKey(WeatherType w) noexcept         { return KeyOf(kWeatherKeys, w); }
const char* ToKey(VariationBucket b) noexcept     { return KeyOf(kBucketKeys, b); }
const char* ToKey(TemperatureCategory c) noexcept { return KeyOf(kCategoryKeys, c); }
const char* ToKey(TimeOfDay t) noexcept           { return KeyOf(kTimeKeys, t); }

std::string DisplayName(Season s)        { return Titled(ToKey(s)); }
std::string DisplayName(Region r)        { return Titled(ToKey(r)); }
std::string DisplayName(WindStrength s)  { return Titled(ToKey(s)); }
std::string DisplayName(WindDirection d) { return Titled(ToKey(d)); }
std::string DisplayName(TimeOfDay t)     { return Titled(ToKey(t)); }

Season ParseSeason(std::string_view text)
{
    return ParseKey<Season>(kSeasonKeys, text, "season");
}

Region ParseRegion(std::string_view text)
{
    return ParseKey<Region>(kRegionKeys, text, "region");
}

WindStrength ParseWindStrength(std::string_view text)
{
    return ParseKey<WindStrength>(kStrengthKeys, text, "wind strength");
}

WindDirection ParseWindDirection(std::string_view text)
{
    return ParseKey<WindDirection>(kDirectionKeys, text, "wind direction");
}

WeatherType ParseWeatherType(std::string_view text)
{
    return ParseKey<WeatherType>(kWeatherKeys, text, "weather type");
}

TemperatureCategory ParseTemperatureCategory(std::string_view text)
{
    return ParseKey<TemperatureCategory>(kCategoryKeys, text, "temperature category");
}

TimeOfDay ParseTimeOfDay(std::string_view text)
{
    return ParseKey<TimeOfDay>(kTimeKeys, text, "time of day");
}

} // namespace voyage::weather
