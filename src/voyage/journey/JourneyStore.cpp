// src/voyage/journey/JourneyStore.cpp
#include "voyage/journey/JourneyStore.hpp"
#include "voyage/journey/JourneyJson.hpp"
#include "voyage/core/Errors.hpp"
#include "voyage/core/Log.hpp"
#include "voyage/io/AtomicFile.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

namespace voyage::journey {

namespace fs = std::filesystem;

namespace {
constexpr std::size_t kMaxKeyLength = 64;

void UpsertDay(std::vector<DailyWeatherRecord>& days, const DailyWeatherRecord& record)
{
    auto it = std::lower_bound(days.begin(), days.end(), record.day,
                               [](const DailyWeatherRecord& r, int day) { return r.day < day; });
    if (it != days.end() && it->day == record.day)
        *it = record;
    else
        days.insert(it, record);
}
} // namespace

void ValidateJourneyKey(const std::string& key)
{
    if (key.empty() || key.size() > kMaxKeyLength)
        throw ConfigurationError("journey key must be 1-64 characters");

    for (char c : key)
    {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                        (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!ok)
            throw ConfigurationError("journey key '" + key + "' may only contain letters, digits, '_' and '-'");
    }
}

// ---------- InMemoryJourneyStore ----------

std::optional<JourneyState> InMemoryJourneyStore::loadJourney(const std::string& key)
{
    std::lock_guard lock(m_mutex);
    auto it = m_entries.find(key);
    if (it == m_entries.end()) return std::nullopt;
    return it->second.state;
}

void InMemoryJourneyStore::saveJourney(const std::string& key, const JourneyState& state)
{
    std::lock_guard lock(m_mutex);
    m_entries[key].state = state;
}

void InMemoryJourneyStore::saveDay(const std::string& key, const DailyWeatherRecord& record)
{
    std::lock_guard lock(m_mutex);
    auto it = m_entries.find(key);
    if (it == m_entries.end()) throw JourneyNotFound(key);
    it->second.days[record.day] = record;
}

std::optional<DailyWeatherRecord> InMemoryJourneyStore::loadDay(const std::string& key, int day)
{
    std::lock_guard lock(m_mutex);
    auto it = m_entries.find(key);
    if (it == m_entries.end()) return std::nullopt;
    auto d = it->second.days.find(day);
    if (d == it->second.days.end()) return std::nullopt;
    return d->second;
}

std::vector<DailyWeatherRecord> InMemoryJourneyStore::loadDays(const std::string& key)
{
    std::lock_guard lock(m_mutex);
    std::vector<DailyWeatherRecord> out;
    auto it = m_entries.find(key);
    if (it == m_entries.end()) return out;
    out.reserve(it->second.days.size());
    for (const auto& [day, rec] : it->second.days) out.push_back(rec);
    return out;
}

void InMemoryJourneyStore::commitDay(const std::string& key, const DailyWeatherRecord& record,
                                     const JourneyState& state)
{
    std::lock_guard lock(m_mutex);
    auto it = m_entries.find(key);
    if (it == m_entries.end()) throw JourneyNotFound(key);

    Entry next = it->second;
    next.days[record.day] = record;
    next.state            = state;
    it->second = std::move(next);
}

bool InMemoryJourneyStore::eraseJourney(const std::string& key)
{
    std::lock_guard lock(m_mutex);
    return m_entries.erase(key) > 0;
}

// ---------- JsonFileJourneyStore ----------

JsonFileJourneyStore::JsonFileJourneyStore(fs::path root)
    : m_root(std::move(root))
{
}

fs::path JsonFileJourneyStore::pathFor(const std::string& key) const
{
    ValidateJourneyKey(key);
    return m_root / "journeys" / (key + ".json");
}

bool JsonFileJourneyStore::read(const std::string& key, JourneyDocument& out) const
{
    const fs::path path = pathFor(key);

    std::error_code ec;
    if (!fs::exists(path, ec))
    {
        if (ec)
            throw StorageError("cannot stat " + path.string() + ": " + ec.message());
        return false;
    }

    std::string text;
    std::string err;
    if (!io::read_all(path, text, &err))
        throw StorageError("cannot read " + path.string() + ": " + err);

    try {
        json doc = json::parse(text); // throws on malformed JSON
        if (!doc.is_object())
            throw StorageError(path.string() + ": root JSON must be an object");

        std::string migErr;
        if (!MigrateJsonInPlace(doc, kJourneySchemaVersion, migErr))
            throw StorageError(path.string() + ": " + migErr);

        out = doc.get<JourneyDocument>();
    }
    catch (const nlohmann::json::exception& e) {
        throw StorageError(path.string() + " is not a valid journey document: " + e.what());
    }
    catch (const ConfigurationError& e) {
        throw StorageError(path.string() + " holds an unknown key: " + e.what());
    }
    return true;
}

void JsonFileJourneyStore::write(const std::string& key, JourneyDocument& doc) const
{
    doc.schema_version = kJourneySchemaVersion;
    doc.key            = key;
    doc.last_saved_utc = NowUtcIso8601();

    const json j = doc;
    const std::string text = j.dump(2);

    const fs::path path = pathFor(key);
    std::string err;
    if (!io::write_atomic(path, text, &err, /*make_backup=*/true))
    {
        logsys::get()->error("journey store: write failed for {}: {}", path.string(), err);
        throw StorageError("cannot write " + path.string() + ": " + err);
    }
}

std::optional<JourneyState> JsonFileJourneyStore::loadJourney(const std::string& key)
{
    std::lock_guard lock(m_mutex);
    JourneyDocument doc;
    if (!read(key, doc)) return std::nullopt;
    return doc.journey;
}

void JsonFileJourneyStore::saveJourney(const std::string& key, const JourneyState& state)
{
    std::lock_guard lock(m_mutex);
    JourneyDocument doc;
    if (!read(key, doc))
        logsys::get()->debug("journey store: creating {}", pathFor(key).string());
    doc.journey = state;
    write(key, doc);
}

void JsonFileJourneyStore::saveDay(const std::string& key, const DailyWeatherRecord& record)
{
    std::lock_guard lock(m_mutex);
    JourneyDocument doc;
    if (!read(key, doc)) throw JourneyNotFound(key);
    UpsertDay(doc.days, record);
    write(key, doc);
}

std::optional<DailyWeatherRecord> JsonFileJourneyStore::loadDay(const std::string& key, int day)
{
    std::lock_guard lock(m_mutex);
    JourneyDocument doc;
    if (!read(key, doc)) return std::nullopt;
    for (const auto& rec : doc.days)
        if (rec.day == day) return rec;
    return std::nullopt;
}

std::vector<DailyWeatherRecord> JsonFileJourneyStore::loadDays(const std::string& key)
{
    std::lock_guard lock(m_mutex);
    JourneyDocument doc;
    if (!read(key, doc)) return {};
    std::sort(doc.days.begin(), doc.days.end(),
              [](const DailyWeatherRecord& a, const DailyWeatherRecord& b) { return a.day < b.day; });
    return doc.days;
}

void JsonFileJourneyStore::commitDay(const std::string& key, const DailyWeatherRecord& record,
                                     const JourneyState& state)
{
    std::lock_guard lock(m_mutex);
    JourneyDocument doc;
    if (!read(key, doc)) throw JourneyNotFound(key);
    UpsertDay(doc.days, record);
    doc.journey = state;
    write(key, doc);
}

bool JsonFileJourneyStore::eraseJourney(const std::string& key)
{
    std::lock_guard lock(m_mutex);
    const fs::path path = pathFor(key);

    std::error_code ec;
    const bool removed = fs::remove(path, ec);
    if (ec)
        throw StorageError("cannot remove " + path.string() + ": " + ec.message());

    fs::remove(io::default_backup_path(path), ec);
    if (ec)
        logsys::get()->warn("journey store: could not remove backup for {}: {}", key, ec.message());
    return removed;
}

} // namespace voyage::journey
