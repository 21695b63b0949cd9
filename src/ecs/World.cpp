#include "ecs/World.hpp"
#include "engine/Log.hpp"

namespace spectral {

const char* roleName(Role role) {
    switch (role) {
        case Role::None:            return "none";
        case Role::Pooled:          return "pooled";
        case Role::ActiveEnemy:     return "enemy";
        case Role::Player:          return "player";
        case Role::Projectile:      return "projectile";
        case Role::EnemyProjectile: return "enemyProjectile";
        case Role::Effect:          return "effect";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// SceneGraph
// ---------------------------------------------------------------------------

bool SceneGraph::attach(Entity entity) {
    return m_attached.insert(entity).second;
}

bool SceneGraph::detach(Entity entity) {
    return m_attached.erase(entity) > 0;
}

bool SceneGraph::isAttached(Entity entity) const {
    return m_attached.count(entity) > 0;
}

uint32_t SceneGraph::createResource(const std::string& kind) {
    uint32_t id = m_nextResourceId++;
    m_resources.emplace(id, kind);
    return id;
}

bool SceneGraph::disposeResource(uint32_t id) {
    return m_resources.erase(id) > 0;
}

void SceneGraph::clear() {
    m_attached.clear();
    m_resources.clear();
}

// ---------------------------------------------------------------------------
// World
// ---------------------------------------------------------------------------

Entity World::createEntity(Role role) {
    Entity entity = m_registry.create();
    m_registry.add<EntityRole>(entity, role);
    return entity;
}

void World::destroyEntity(Entity entity) {
    if (!m_registry.valid(entity)) {
        return;
    }
    if (auto* trail = m_registry.tryGet<TrailEffect>(entity)) {
        if (trail->resourceId != 0) {
            m_scene.disposeResource(trail->resourceId);
        }
    }
    m_scene.detach(entity);
    if (entity == m_player) {
        m_player = NullEntity;
    }
    m_registry.destroy(entity);
}

Role World::roleOf(Entity entity) const {
    const auto* role = m_registry.tryGet<EntityRole>(entity);
    return role ? role->role : Role::None;
}

void World::setRole(Entity entity, Role role) {
    if (!m_registry.valid(entity)) {
        LOG_WARN("World::setRole: entity {} is not alive", toIntegral(entity));
        return;
    }
    m_registry.addOrReplace<EntityRole>(entity, role);
}

std::vector<Entity> World::entitiesWithRole(Role role) {
    return m_registry.findAll<EntityRole>([this, role](Entity e) {
        return m_registry.get<EntityRole>(e).role == role;
    });
}

std::optional<Vec3> World::positionOf(Entity entity) const {
    if (const auto* transform = m_registry.tryGet<Transform>(entity)) {
        return transform->position;
    }
    return std::nullopt;
}

size_t World::entityCount() {
    size_t n = 0;
    for ([[maybe_unused]] auto e : m_registry.view<EntityRole>()) {
        ++n;
    }
    return n;
}

void World::clear() {
    m_registry.clear();
    m_scene.clear();
    m_player = NullEntity;
}

} // namespace spectral
