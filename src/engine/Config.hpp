#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace spectral {

/// JSON-backed key/value configuration read with dot-notation paths,
/// e.g. "spawner.maxEnemies".
class Config {
public:
    /// Load configuration from a JSON file. Returns false if the file
    /// cannot be read or parsed; missing keys fall back to defaults.
    bool loadFromFile(const std::string& path);

    /// Load configuration from a JSON string (useful for testing).
    bool loadFromString(const std::string& jsonStr);

    /// Merge another JSON file on top of the current configuration.
    /// The current config is unchanged on failure.
    bool mergeFromFile(const std::string& path);

    /// Save the current configuration to a JSON file.
    bool saveToFile(const std::string& path) const;

    // --- Getters (dot-notation key paths) ---

    std::string getString(const std::string& key, const std::string& defaultVal = "") const;
    int         getInt(const std::string& key, int defaultVal = 0) const;
    float       getFloat(const std::string& key, float defaultVal = 0.0f) const;
    bool        getBool(const std::string& key, bool defaultVal = false) const;

    // --- Setters (dot-notation key paths) ---

    void setString(const std::string& key, const std::string& value);
    void setInt(const std::string& key, int value);
    void setFloat(const std::string& key, float value);
    void setBool(const std::string& key, bool value);

    bool hasKey(const std::string& key) const;

    const nlohmann::json& raw() const { return m_data; }

private:
    const nlohmann::json* resolve(const std::string& key) const;
    nlohmann::json& resolveOrCreate(const std::string& key);

    /// Value at `key` if it passes the type check, else the default
    template<typename T, typename TypeCheck>
    T lookup(const std::string& key, TypeCheck typeCheck, const T& defaultVal) const {
        const nlohmann::json* value = resolve(key);
        return value && typeCheck(*value) ? value->get<T>() : defaultVal;
    }

    /// Recursively merge `overlay` into `base`; non-object values replace outright.
    static void mergeJson(nlohmann::json& base, const nlohmann::json& overlay);

    nlohmann::json m_data = nlohmann::json::object();
};

} // namespace spectral
