#pragma once
// include/voyage/journey/JourneyStore.hpp
//
// Persistence boundary for journeys. The orchestrator holds the only
// reference; the weather engine never sees a store.
//
// Failures to reach or decode the backing storage are reported as
// voyage::StorageError. A key the store has no journey for is not an error
// for the load* calls (they return empty); writing a day for such a key
// throws voyage::JourneyNotFound.

#include "voyage/journey/Journey.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace voyage::journey {

struct JourneyDocument;

class JourneyStore {
public:
    virtual ~JourneyStore() = default;

    [[nodiscard]] virtual std::optional<JourneyState> loadJourney(const std::string& key) = 0;
    virtual void saveJourney(const std::string& key, const JourneyState& state) = 0;

    // Appends, or replaces the record with the same day number.
    virtual void saveDay(const std::string& key, const DailyWeatherRecord& record) = 0;
    [[nodiscard]] virtual std::optional<DailyWeatherRecord> loadDay(const std::string& key, int day) = 0;
    // Ascending by day.
    [[nodiscard]] virtual std::vector<DailyWeatherRecord> loadDays(const std::string& key) = 0;

    // Stores a generated day and the journey state that follows it in one
    // write. After a throw neither the record nor the state has changed.
    virtual void commitDay(const std::string& key, const DailyWeatherRecord& record,
                           const JourneyState& state) = 0;

    // Removes the journey and all of its days. Returns false if there was none.
    virtual bool eraseJourney(const std::string& key) = 0;
};

class InMemoryJourneyStore final : public JourneyStore {
public:
    std::optional<JourneyState> loadJourney(const std::string& key) override;
    void saveJourney(const std::string& key, const JourneyState& state) override;
    void saveDay(const std::string& key, const DailyWeatherRecord& record) override;
    std::optional<DailyWeatherRecord> loadDay(const std::string& key, int day) override;
    std::vector<DailyWeatherRecord> loadDays(const std::string& key) override;
    void commitDay(const std::string& key, const DailyWeatherRecord& record,
                   const JourneyState& state) override;
    bool eraseJourney(const std::string& key) override;

private:
    struct Entry {
        JourneyState                      state;
        std::map<int, DailyWeatherRecord> days;
    };

    std::mutex                   m_mutex;
    std::map<std::string, Entry> m_entries;
};

// One JSON document per journey: <root>/journeys/<key>.json, replaced
// atomically on every write. Keys are limited to [A-Za-z0-9_-], 1-64 chars,
// so they are always safe file names; anything else is a ConfigurationError.
class JsonFileJourneyStore final : public JourneyStore {
public:
    explicit JsonFileJourneyStore(std::filesystem::path root);

    std::optional<JourneyState> loadJourney(const std::string& key) override;
    void saveJourney(const std::string& key, const JourneyState& state) override;
    void saveDay(const std::string& key, const DailyWeatherRecord& record) override;
    std::optional<DailyWeatherRecord> loadDay(const std::string& key, int day) override;
    std::vector<DailyWeatherRecord> loadDays(const std::string& key) override;
    void commitDay(const std::string& key, const DailyWeatherRecord& record,
                   const JourneyState& state) override;
    bool eraseJourney(const std::string& key) override;

    [[nodiscard]] std::filesystem::path pathFor(const std::string& key) const;
    [[nodiscard]] const std::filesystem::path& root() const noexcept { return m_root; }

private:
    // false when there is no document for `key`
    bool read(const std::string& key, JourneyDocument& out) const;
    void write(const std::string& key, JourneyDocument& doc) const;

    std::filesystem::path m_root;
    std::mutex            m_mutex;
};

// Throws ConfigurationError unless `key` is a usable journey key.
void ValidateJourneyKey(const std::string& key);

} // namespace voyage::journey
