#pragma once

#include "ecs/Entity.hpp"

#include <vector>
#include <utility>

namespace spectral {

/// Typed component table over EnTT. Components are looked up by type at
/// compile time; there is no string-keyed access.
class Registry {
public:
    Registry() = default;
    ~Registry() = default;

    // Non-copyable, movable
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;
    Registry(Registry&&) = default;
    Registry& operator=(Registry&&) = default;

    /// Create a new entity
    Entity create() {
        return m_registry.create();
    }

    /// Destroy an entity; stale handles are ignored
    void destroy(Entity entity) {
        if (valid(entity)) {
            m_registry.destroy(entity);
        }
    }

    bool valid(Entity entity) const {
        return m_registry.valid(entity);
    }

    template<typename Component, typename... Args>
    Component& add(Entity entity, Args&&... args) {
        return m_registry.emplace<Component>(entity, std::forward<Args>(args)...);
    }

    template<typename Component, typename... Args>
    Component& addOrReplace(Entity entity, Args&&... args) {
        return m_registry.emplace_or_replace<Component>(entity, std::forward<Args>(args)...);
    }

    template<typename Component>
    void remove(Entity entity) {
        if (valid(entity) && has<Component>(entity)) {
            m_registry.remove<Component>(entity);
        }
    }

    /// Get a component from an entity (returns nullptr if absent or the handle is stale)
    template<typename Component>
    Component* tryGet(Entity entity) {
        return valid(entity) ? m_registry.try_get<Component>(entity) : nullptr;
    }

    template<typename Component>
    const Component* tryGet(Entity entity) const {
        return valid(entity) ? m_registry.try_get<Component>(entity) : nullptr;
    }

    /// Get a component from an entity (assumes it exists)
    template<typename Component>
    Component& get(Entity entity) {
        return m_registry.get<Component>(entity);
    }

    template<typename Component>
    const Component& get(Entity entity) const {
        return m_registry.get<Component>(entity);
    }

    template<typename Component>
    bool has(Entity entity) const {
        return valid(entity) && m_registry.all_of<Component>(entity);
    }

    template<typename... Components>
    bool hasAll(Entity entity) const {
        return valid(entity) && m_registry.all_of<Components...>(entity);
    }

    template<typename... Components>
    auto view() {
        return m_registry.view<Components...>();
    }

    /// Iterate over all entities with specified components
    template<typename... Components, typename Func>
    void each(Func&& func) {
        m_registry.view<Components...>().each(std::forward<Func>(func));
    }

    void clear() {
        m_registry.clear();
    }

    /// Find all entities matching a predicate
    template<typename... Components, typename Func>
    std::vector<Entity> findAll(Func&& predicate) {
        std::vector<Entity> results;
        for (auto entity : m_registry.view<Components...>()) {
            if (predicate(entity)) {
                results.push_back(entity);
            }
        }
        return results;
    }

private:
    entt::registry m_registry;
};

} // namespace spectral
