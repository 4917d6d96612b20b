#pragma once
// include/voyage/journey/JourneyJson.hpp
//
// Versioned journey document + nlohmann::json (de)serialization.
// Enums are written as their snake_case keys. Unknown fields are preserved
// and written back so newer documents survive a round trip through older code.

#include "voyage/journey/Journey.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace voyage::weather {

using json = nlohmann::json;

// Unknown keys throw ConfigurationError.
void to_json(json& j, Season v);
void from_json(const json& j, Season& v);
void to_json(json& j, Region v);
void from_json(const json& j, Region& v);
void to_json(json& j, WindStrength v);
void from_json(const json& j, WindStrength& v);
void to_json(json& j, WindDirection v);
void from_json(const json& j, WindDirection& v);
void to_json(json& j, WeatherType v);
void from_json(const json& j, WeatherType& v);
void to_json(json& j, TemperatureCategory v);
void from_json(const json& j, TemperatureCategory& v);
void to_json(json& j, TimeOfDay v);
void from_json(const json& j, TimeOfDay& v);

void to_json(json& j, const WindState& v);
void from_json(const json& j, WindState& v);
void to_json(json& j, const WindReading& v);
void from_json(const json& j, WindReading& v);
void to_json(json& j, const EventProgress& v);
void from_json(const json& j, EventProgress& v);
void to_json(json& j, const EventState& v);
void from_json(const json& j, EventState& v);
void to_json(json& j, const Cooldowns& v);
void from_json(const json& j, Cooldowns& v);

} // namespace voyage::weather

namespace voyage::journey {

using json = nlohmann::json;

inline constexpr int kJourneySchemaVersion = 1;

struct JourneyDocument {
    // Bump when the layout changes (and add a step to MigrateJsonInPlace).
    int                             schema_version{kJourneySchemaVersion};
    std::string                     key;
    std::string                     last_saved_utc;
    JourneyState                    journey;
    std::vector<DailyWeatherRecord> days;   // ascending by day

    json extras = json::object();
};

void to_json(json& j, DisplayMode v);
void from_json(const json& j, DisplayMode& v);

void to_json(json& j, const JourneyState& v);
void from_json(const json& j, JourneyState& v);

void to_json(json& j, const DailyWeatherRecord& v);
void from_json(const json& j, DailyWeatherRecord& v);

void to_json(json& j, const JourneyDocument& v);
void from_json(const json& j, JourneyDocument& v);

// Updates raw JSON in place from older schema versions to `target`.
// Returns false (with outError set) when no migration path exists.
bool MigrateJsonInPlace(json& j, int target_schema_version, std::string& outError);

[[nodiscard]] std::string NowUtcIso8601();

} // namespace voyage::journey
