#include "engine/Config.hpp"
#include "engine/Log.hpp"

#include <fstream>
#include <sstream>

namespace spectral {

bool Config::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Config: could not open '{}'", path);
        return false;
    }

    try {
        m_data = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& ex) {
        LOG_ERROR("Config: parse error in '{}': {}", path, ex.what());
        return false;
    }
    return true;
}

bool Config::loadFromString(const std::string& jsonStr) {
    try {
        m_data = nlohmann::json::parse(jsonStr);
    } catch (const nlohmann::json::parse_error& ex) {
        LOG_WARN("Config: parse error in inline config: {}", ex.what());
        return false;
    }
    return true;
}

bool Config::mergeFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    nlohmann::json overlay;
    try {
        overlay = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& ex) {
        LOG_WARN("Config: ignoring overlay '{}': {}", path, ex.what());
        return false;
    }

    nlohmann::json merged = m_data;
    mergeJson(merged, overlay);
    m_data = std::move(merged);
    return true;
}

bool Config::saveToFile(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Config: could not open '{}' for writing", path);
        return false;
    }

    file << m_data.dump(4) << '\n';
    return file.good();
}

// ---------------------------------------------------------------------------
// Key resolution
// ---------------------------------------------------------------------------

const nlohmann::json* Config::resolve(const std::string& key) const {
    const nlohmann::json* current = &m_data;
    std::istringstream stream(key);
    std::string segment;

    while (std::getline(stream, segment, '.')) {
        if (!current->is_object() || !current->contains(segment)) {
            return nullptr;
        }
        current = &(*current)[segment];
    }
    return current;
}

nlohmann::json& Config::resolveOrCreate(const std::string& key) {
    nlohmann::json* current = &m_data;
    std::istringstream stream(key);
    std::string segment;

    while (std::getline(stream, segment, '.')) {
        if (!current->is_object()) {
            if (!current->is_null()) {
                LOG_WARN("Config: replacing non-object value while setting '{}'", key);
            }
            *current = nlohmann::json::object();
        }
        current = &(*current)[segment];
    }
    return *current;
}

// ---------------------------------------------------------------------------
// Typed access
// ---------------------------------------------------------------------------

bool Config::hasKey(const std::string& key) const {
    return resolve(key) != nullptr;
}

std::string Config::getString(const std::string& key, const std::string& defaultVal) const {
    return lookup<std::string>(key, [](const nlohmann::json& v) { return v.is_string(); }, defaultVal);
}

int Config::getInt(const std::string& key, int defaultVal) const {
    return lookup<int>(key, [](const nlohmann::json& v) { return v.is_number_integer(); }, defaultVal);
}

float Config::getFloat(const std::string& key, float defaultVal) const {
    return lookup<float>(key, [](const nlohmann::json& v) { return v.is_number(); }, defaultVal);
}

bool Config::getBool(const std::string& key, bool defaultVal) const {
    return lookup<bool>(key, [](const nlohmann::json& v) { return v.is_boolean(); }, defaultVal);
}

void Config::setString(const std::string& key, const std::string& value) { resolveOrCreate(key) = value; }
void Config::setInt(const std::string& key, int value) { resolveOrCreate(key) = value; }
void Config::setFloat(const std::string& key, float value) { resolveOrCreate(key) = value; }
void Config::setBool(const std::string& key, bool value) { resolveOrCreate(key) = value; }

void Config::mergeJson(nlohmann::json& base, const nlohmann::json& overlay) {
    if (!overlay.is_object()) {
        base = overlay;
        return;
    }
    if (!base.is_object()) {
        base = nlohmann::json::object();
    }
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        if (it->is_object() && base.contains(it.key()) && base[it.key()].is_object()) {
            mergeJson(base[it.key()], *it);
        } else {
            base[it.key()] = *it;
        }
    }
}

} // namespace spectral
