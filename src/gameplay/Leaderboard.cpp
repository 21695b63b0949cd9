#include "gameplay/Leaderboard.hpp"
#include "engine/Log.hpp"

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace spectral {

// ---------------------------------------------------------------------------
// PersistentStore
// ---------------------------------------------------------------------------

PersistentStore::PersistentStore(std::string path)
    : m_path(std::move(path)) {
}

bool PersistentStore::set(const std::string& key, const nlohmann::json& value) {
    nlohmann::json previous = m_data.contains(key) ? m_data[key] : nlohmann::json();
    bool existed = m_data.contains(key);
    m_data[key] = value;

    size_t size = m_data.dump().size();
    if (size > MAX_STORE_FILE_SIZE) {
        // Revert the change
        if (existed) {
            m_data[key] = std::move(previous);
        } else {
            m_data.erase(key);
        }
        LOG_WARN("PersistentStore::set: '{}' would exceed {} byte limit (attempted: {} bytes)",
                 key, MAX_STORE_FILE_SIZE, size);
        return false;
    }

    m_dirty = true;
    return true;
}

nlohmann::json PersistentStore::get(const std::string& key, const nlohmann::json& defaultValue) const {
    auto it = m_data.find(key);
    return it != m_data.end() ? *it : defaultValue;
}

bool PersistentStore::has(const std::string& key) const {
    return m_data.contains(key);
}

bool PersistentStore::remove(const std::string& key) {
    if (m_data.erase(key) > 0) {
        m_dirty = true;
        return true;
    }
    return false;
}

bool PersistentStore::load() {
    if (m_path.empty() || !fs::exists(m_path)) {
        // Nothing saved yet
        return true;
    }

    try {
        std::ifstream file(m_path);
        if (!file.is_open()) {
            LOG_WARN("PersistentStore::load: could not open '{}'", m_path);
            return false;
        }

        nlohmann::json data = nlohmann::json::parse(file);
        if (!data.is_object()) {
            LOG_WARN("PersistentStore::load: '{}' is not a JSON object, trying backup", m_path);
            return loadFromBackup();
        }

        m_data = std::move(data);
        m_dirty = false;
        return true;

    } catch (const nlohmann::json::parse_error& ex) {
        LOG_WARN("PersistentStore::load: parse error in '{}': {}, trying backup", m_path, ex.what());
        return loadFromBackup();
    } catch (const std::exception& ex) {
        LOG_ERROR("PersistentStore::load: error loading '{}': {}", m_path, ex.what());
        return false;
    }
}

bool PersistentStore::save() {
    if (m_path.empty()) {
        m_dirty = false;
        return true;
    }

    try {
        fs::path parent = fs::path(m_path).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }
    } catch (const std::exception& ex) {
        LOG_ERROR("PersistentStore::save: failed to create directory for '{}': {}", m_path, ex.what());
        return false;
    }

    if (fs::exists(m_path)) {
        try {
            fs::copy_file(m_path, backupPath(), fs::copy_options::overwrite_existing);
        } catch (const std::exception& ex) {
            LOG_WARN("PersistentStore::save: failed to back up '{}': {}", m_path, ex.what());
        }
    }

    try {
        std::ofstream file(m_path);
        if (!file.is_open()) {
            LOG_ERROR("PersistentStore::save: could not open '{}' for writing", m_path);
            return false;
        }
        file << m_data.dump(2);
        file.close();

        if (file.fail()) {
            LOG_ERROR("PersistentStore::save: write error for '{}'", m_path);
            return false;
        }

        m_dirty = false;
        return true;
    } catch (const std::exception& ex) {
        LOG_ERROR("PersistentStore::save: error saving '{}': {}", m_path, ex.what());
        return false;
    }
}

void PersistentStore::clear() {
    m_data = nlohmann::json::object();
    m_dirty = false;
}

bool PersistentStore::loadFromBackup() {
    const std::string backup = backupPath();
    if (!fs::exists(backup)) {
        LOG_WARN("PersistentStore: no backup found for '{}'", m_path);
        return false;
    }

    try {
        std::ifstream file(backup);
        nlohmann::json data = nlohmann::json::parse(file);
        if (!data.is_object()) {
            LOG_ERROR("PersistentStore: backup '{}' is also invalid", backup);
            return false;
        }

        m_data = std::move(data);
        m_dirty = false;
        LOG_WARN("PersistentStore: loaded '{}' from backup (primary file was corrupted)", m_path);
        return true;
    } catch (const std::exception& ex) {
        LOG_ERROR("PersistentStore: backup '{}' is also corrupted: {}", backup, ex.what());
        return false;
    }
}

// ---------------------------------------------------------------------------
// HighScoreEntry
// ---------------------------------------------------------------------------

void to_json(nlohmann::json& j, const HighScoreEntry& entry) {
    j = nlohmann::json{
        {"score", entry.score},
        {"wave", entry.wave},
        {"survivalTimeSeconds", entry.survivalTimeSeconds},
        {"isoDate", entry.isoDate},
    };
}

void from_json(const nlohmann::json& j, HighScoreEntry& entry) {
    entry.score = j.value("score", 0);
    entry.wave = j.value("wave", 0);
    entry.survivalTimeSeconds = j.value("survivalTimeSeconds", 0.0f);
    entry.isoDate = j.value("isoDate", std::string());
}

// ---------------------------------------------------------------------------
// Leaderboard
// ---------------------------------------------------------------------------

Leaderboard::Leaderboard(PersistentStore& store, size_t capacity)
    : m_store(store)
    , m_capacity(std::max<size_t>(1, capacity)) {
}

std::vector<HighScoreEntry> Leaderboard::getHighScores() const {
    std::vector<HighScoreEntry> scores;
    nlohmann::json stored = m_store.get(STORAGE_KEY, nlohmann::json::array());
    if (!stored.is_array()) {
        LOG_WARN("Leaderboard: stored '{}' is not an array, ignoring", STORAGE_KEY);
        return scores;
    }

    for (const auto& item : stored) {
        if (!item.is_object()) {
            LOG_WARN("Leaderboard: skipping malformed entry {}", item.dump());
            continue;
        }
        try {
            scores.push_back(item.get<HighScoreEntry>());
        } catch (const nlohmann::json::exception& ex) {
            LOG_WARN("Leaderboard: skipping unreadable entry: {}", ex.what());
        }
    }

    std::stable_sort(scores.begin(), scores.end(),
        [](const HighScoreEntry& a, const HighScoreEntry& b) { return a.score > b.score; });
    if (scores.size() > m_capacity) {
        scores.resize(m_capacity);
    }
    return scores;
}

bool Leaderboard::isNewHighScore(int score) const {
    auto scores = getHighScores();
    if (scores.size() < m_capacity) {
        return score > 0;
    }
    return score > scores.back().score;
}

bool Leaderboard::saveHighScore(int score, int wave, float survivalTimeSeconds, const std::string& isoDate) {
    if (!isNewHighScore(score)) {
        return false;
    }

    auto scores = getHighScores();
    scores.push_back({score, wave, survivalTimeSeconds, isoDate});
    std::stable_sort(scores.begin(), scores.end(),
        [](const HighScoreEntry& a, const HighScoreEntry& b) { return a.score > b.score; });
    if (scores.size() > m_capacity) {
        scores.resize(m_capacity);
    }

    if (!m_store.set(STORAGE_KEY, scores)) {
        return false;
    }
    if (!m_store.save()) {
        LOG_WARN("Leaderboard: score {} recorded but could not be written to disk", score);
    }
    LOG_INFO("Leaderboard: new high score {} (wave {}, {:.0f}s)", score, wave, survivalTimeSeconds);
    return true;
}

std::string Leaderboard::currentIsoDate() {
    std::time_t now = std::time(nullptr);
    std::tm utc{};
#if defined(_WIN32)
    gmtime_s(&utc, &now);
#else
    gmtime_r(&now, &utc);
#endif
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buffer;
}

} // namespace spectral
