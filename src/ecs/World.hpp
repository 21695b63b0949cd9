#pragma once

#include "ecs/Registry.hpp"
#include "ecs/Components.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace spectral {

/// Render scene boundary: which entities have their mesh parented into the
/// scene, and which graphics resources (trails, effect materials) are live.
class SceneGraph {
public:
    /// @return false if the entity was already attached
    bool attach(Entity entity);
    bool detach(Entity entity);
    bool isAttached(Entity entity) const;
    size_t attachedCount() const { return m_attached.size(); }

    uint32_t createResource(const std::string& kind);
    /// @return false for an unknown or already-disposed resource
    bool disposeResource(uint32_t id);
    bool isResourceLive(uint32_t id) const { return m_resources.count(id) > 0; }
    size_t liveResourceCount() const { return m_resources.size(); }

    void clear();

private:
    std::unordered_set<Entity> m_attached;
    std::unordered_map<uint32_t, std::string> m_resources;
    uint32_t m_nextResourceId = 1;
};

/// Entity world: typed component storage plus the scene it renders into.
class World {
public:
    World() = default;

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    Registry& registry() { return m_registry; }
    const Registry& registry() const { return m_registry; }
    SceneGraph& scene() { return m_scene; }
    const SceneGraph& scene() const { return m_scene; }

    /// Create an entity carrying only its role
    Entity createEntity(Role role = Role::None);

    /// Detach from the scene, dispose owned resources, and destroy.
    /// Stale handles are ignored.
    void destroyEntity(Entity entity);

    bool isAlive(Entity entity) const { return m_registry.valid(entity); }

    /// Role of a live entity; Role::None for stale handles
    Role roleOf(Entity entity) const;
    void setRole(Entity entity, Role role);

    /// All live entities currently holding the given role
    std::vector<Entity> entitiesWithRole(Role role);

    /// World-level player registration, consulted when no entity holds Role::Player
    void setPlayer(Entity entity) { m_player = entity; }
    Entity player() const { return isAlive(m_player) ? m_player : NullEntity; }

    std::optional<Vec3> positionOf(Entity entity) const;

    /// Number of live entities (every entity carries a role)
    size_t entityCount();

    void clear();

private:
    Registry m_registry;
    SceneGraph m_scene;
    Entity m_player = NullEntity;
};

} // namespace spectral
