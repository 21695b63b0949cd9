#pragma once

#include "ecs/Entity.hpp"
#include "engine/Vec3.hpp"

#include <string>
#include <vector>
#include <unordered_map>
#include <functional>
#include <algorithm>
#include <cstdint>

namespace spectral {

/// Message payload: typed key/value pairs attached to a published event
class EventData {
public:
    EventData() = default;

    void setString(const std::string& key, const std::string& value) { m_strings[key] = value; }
    void setFloat(const std::string& key, float value) { m_floats[key] = value; }
    void setInt(const std::string& key, int value) { m_ints[key] = value; }
    void setBool(const std::string& key, bool value) { m_bools[key] = value; }
    void setEntity(const std::string& key, Entity value) { m_entities[key] = value; }

    /// Stores the vector as "<prefix>x", "<prefix>y", "<prefix>z" floats.
    void setVec3(const std::string& prefix, const Vec3& value) {
        m_floats[prefix + "x"] = value.x;
        m_floats[prefix + "y"] = value.y;
        m_floats[prefix + "z"] = value.z;
    }

    std::string getString(const std::string& key, const std::string& def = "") const {
        auto it = m_strings.find(key);
        return it != m_strings.end() ? it->second : def;
    }
    float getFloat(const std::string& key, float def = 0.0f) const {
        auto it = m_floats.find(key);
        return it != m_floats.end() ? it->second : def;
    }
    int getInt(const std::string& key, int def = 0) const {
        auto it = m_ints.find(key);
        return it != m_ints.end() ? it->second : def;
    }
    bool getBool(const std::string& key, bool def = false) const {
        auto it = m_bools.find(key);
        return it != m_bools.end() ? it->second : def;
    }
    Entity getEntity(const std::string& key, Entity def = NullEntity) const {
        auto it = m_entities.find(key);
        return it != m_entities.end() ? it->second : def;
    }
    Vec3 getVec3(const std::string& prefix) const {
        return {getFloat(prefix + "x"), getFloat(prefix + "y"), getFloat(prefix + "z")};
    }

    bool hasString(const std::string& key) const { return m_strings.count(key) > 0; }
    bool hasFloat(const std::string& key) const { return m_floats.count(key) > 0; }
    bool hasInt(const std::string& key) const { return m_ints.count(key) > 0; }
    bool hasBool(const std::string& key) const { return m_bools.count(key) > 0; }
    bool hasEntity(const std::string& key) const { return m_entities.count(key) > 0; }

private:
    std::unordered_map<std::string, std::string> m_strings;
    std::unordered_map<std::string, float> m_floats;
    std::unordered_map<std::string, int> m_ints;
    std::unordered_map<std::string, bool> m_bools;
    std::unordered_map<std::string, Entity> m_entities;
};

/// Handler ID for unsubscribing
using SubscriptionId = uint64_t;

/// Message handler callback. Returns true to stop delivery to later handlers.
using MessageHandler = std::function<bool(const EventData&)>;

/// Synchronous publish/subscribe bus shared by the enemy pipeline and its
/// collaborators (weapons, docking, UI, effects).
class MessageBus {
public:
    MessageBus() = default;

    MessageBus(const MessageBus&) = delete;
    MessageBus& operator=(const MessageBus&) = delete;

    /// Subscribe to an event. Lower priority = called first.
    SubscriptionId subscribe(const std::string& eventName, MessageHandler handler, int priority = 0) {
        SubscriptionId id = m_nextId++;
        m_handlers[eventName].push_back({id, priority, std::move(handler)});
        sortHandlers(eventName);
        return id;
    }

    /// Unsubscribe a handler by ID
    bool unsubscribe(SubscriptionId id) {
        for (auto& [name, handlers] : m_handlers) {
            auto it = std::find_if(handlers.begin(), handlers.end(),
                [id](const HandlerEntry& entry) { return entry.id == id; });
            if (it != handlers.end()) {
                handlers.erase(it);
                return true;
            }
        }
        return false;
    }

    /// Unsubscribe all handlers for an event
    void unsubscribeAll(const std::string& eventName) {
        m_handlers.erase(eventName);
    }

    /// Deliver an event to every handler in priority order.
    /// Returns true if a handler consumed the event.
    bool publish(const std::string& eventName, const EventData& data = {}) {
        ++m_publishCounts[eventName];

        auto it = m_handlers.find(eventName);
        if (it == m_handlers.end()) return false;

        // Copy handlers to allow safe (un)subscription during delivery
        auto handlers = it->second;
        for (const auto& handler : handlers) {
            if (handler.callback(data)) {
                return true;
            }
        }
        return false;
    }

    size_t handlerCount(const std::string& eventName) const {
        auto it = m_handlers.find(eventName);
        return it != m_handlers.end() ? it->second.size() : 0;
    }

    /// Number of times an event has been published since construction or clear().
    size_t publishCount(const std::string& eventName) const {
        auto it = m_publishCounts.find(eventName);
        return it != m_publishCounts.end() ? it->second : 0;
    }

    void clear() {
        m_handlers.clear();
        m_publishCounts.clear();
    }

private:
    struct HandlerEntry {
        SubscriptionId id;
        int priority;
        MessageHandler callback;
    };

    void sortHandlers(const std::string& eventName) {
        auto& handlers = m_handlers[eventName];
        std::stable_sort(handlers.begin(), handlers.end(),
            [](const HandlerEntry& a, const HandlerEntry& b) {
                return a.priority < b.priority;
            });
    }

    std::unordered_map<std::string, std::vector<HandlerEntry>> m_handlers;
    std::unordered_map<std::string, size_t> m_publishCounts;
    SubscriptionId m_nextId = 1;
};

} // namespace spectral
