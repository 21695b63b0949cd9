#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace spectral {

/// Maximum persisted store size (1 MB)
constexpr size_t MAX_STORE_FILE_SIZE = 1024 * 1024;

/// Key/value JSON persistence backed by one file.
///
/// Data is held in memory and flushed by save(). The previous file is kept
/// as `<path>.bak` and used when the primary file is unreadable. An empty
/// path keeps everything in memory.
class PersistentStore {
public:
    explicit PersistentStore(std::string path = "");

    /// @return false if the store would exceed MAX_STORE_FILE_SIZE
    bool set(const std::string& key, const nlohmann::json& value);
    nlohmann::json get(const std::string& key, const nlohmann::json& defaultValue = nlohmann::json()) const;
    bool has(const std::string& key) const;
    bool remove(const std::string& key);

    /// Load from disk. A missing file is not an error.
    bool load();

    /// Write to disk, backing up the previous file first
    bool save();

    void clear();

    const std::string& path() const { return m_path; }
    bool isDirty() const { return m_dirty; }

private:
    std::string backupPath() const { return m_path + ".bak"; }
    bool loadFromBackup();

    std::string m_path;
    nlohmann::json m_data = nlohmann::json::object();
    bool m_dirty = false;
};

/// One finished horde run
struct HighScoreEntry {
    int score = 0;
    int wave = 0;
    float survivalTimeSeconds = 0.0f;
    std::string isoDate;   ///< ISO-8601 UTC
};

void to_json(nlohmann::json& j, const HighScoreEntry& entry);
void from_json(const nlohmann::json& j, HighScoreEntry& entry);

/// Top-N horde scores, highest first, stored under a fixed key.
class Leaderboard {
public:
    static constexpr const char* STORAGE_KEY = "horde_high_scores";
    static constexpr size_t DEFAULT_CAPACITY = 5;

    explicit Leaderboard(PersistentStore& store, size_t capacity = DEFAULT_CAPACITY);

    std::vector<HighScoreEntry> getHighScores() const;

    /// True if the score would enter the table
    bool isNewHighScore(int score) const;

    /// Merge a run into the table and persist it.
    /// @return true if the run made the table
    bool saveHighScore(int score, int wave, float survivalTimeSeconds,
                       const std::string& isoDate = currentIsoDate());

    size_t capacity() const { return m_capacity; }

    static std::string currentIsoDate();

private:
    PersistentStore& m_store;
    size_t m_capacity;
};

} // namespace spectral
