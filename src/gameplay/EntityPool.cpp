#include "gameplay/EntityPool.hpp"
#include "engine/Log.hpp"

#include <algorithm>
#include <unordered_set>

namespace spectral {

EntityPool::EntityPool(World& world, const PoolSettings& settings)
    : m_world(world)
    , m_maxSize(static_cast<size_t>(std::max(0, settings.maxPoolSize))) {
    m_inactive.reserve(m_maxSize);
}

size_t EntityPool::preallocate(size_t n) {
    size_t created = 0;
    while (created < n && m_inactive.size() < m_maxSize) {
        Entity entity = createBareEnemy();
        stash(entity);
        m_inactive.push_back(entity);
        ++created;
    }
    if (created < n) {
        LOG_DEBUG("EntityPool: preallocated {} of {} requested (cap {})", created, n, m_maxSize);
    } else {
        LOG_DEBUG("EntityPool: preallocated {} entities", created);
    }
    return created;
}

Entity EntityPool::acquire() {
    auto& registry = m_world.registry();

    while (!m_inactive.empty()) {
        Entity entity = m_inactive.back();
        m_inactive.pop_back();

        if (!m_world.isAlive(entity)) {
            LOG_WARN("EntityPool::acquire: discarding stale handle {}", toIntegral(entity));
            continue;
        }

        m_world.setRole(entity, Role::None);
        registry.remove<Frozen>(entity);

        auto* ai = registry.tryGet<EnemyAI>(entity);
        if (!ai) {
            ai = &registry.add<EnemyAI>(entity);
        }
        ai->reset(m_rng);

        if (auto* body = registry.tryGet<Rigidbody>(entity)) {
            body->stop();
        } else {
            registry.add<Rigidbody>(entity);
        }
        if (!registry.has<Transform>(entity)) registry.add<Transform>(entity);
        if (!registry.has<Health>(entity)) registry.add<Health>(entity);
        if (!registry.has<RenderMesh>(entity)) registry.add<RenderMesh>(entity);
        registry.addOrReplace<VariantState>(entity);

        ++m_stats.reused;
        return entity;
    }

    Entity entity = createBareEnemy();
    registry.get<EnemyAI>(entity).reset(m_rng);
    ++m_stats.created;
    LOG_DEBUG("EntityPool: pool empty, created entity {}", toIntegral(entity));
    return entity;
}

void EntityPool::release(Entity entity) {
    if (!m_world.isAlive(entity)) {
        LOG_WARN("EntityPool::release: entity {} is not alive", toIntegral(entity));
        return;
    }
    if (m_world.roleOf(entity) == Role::Pooled) {
        LOG_DEBUG("EntityPool::release: entity {} is already pooled", toIntegral(entity));
        return;
    }

    stash(entity);

    if (m_inactive.size() < m_maxSize) {
        m_inactive.push_back(entity);
        ++m_stats.released;
    } else {
        m_world.destroyEntity(entity);
        ++m_stats.destroyed;
    }
}

int EntityPool::runDiagnostics(ActiveEnemySet& activeSet) {
    int fixes = 0;
    try {
        // Stale handles and duplicate entries
        std::unordered_set<Entity> seen;
        std::vector<Entity> cleaned;
        cleaned.reserve(m_inactive.size());
        for (Entity entity : m_inactive) {
            if (!m_world.isAlive(entity)) {
                DIAG_LOG_WARN("Pool: removed stale handle {}", toIntegral(entity));
                ++fixes;
                continue;
            }
            if (!seen.insert(entity).second) {
                DIAG_LOG_WARN("Pool: removed duplicate entry {}", toIntegral(entity));
                ++fixes;
                continue;
            }
            cleaned.push_back(entity);
        }
        m_inactive.swap(cleaned);

        // Entities both pooled and active: the role decides which side keeps it
        for (auto it = m_inactive.begin(); it != m_inactive.end();) {
            Entity entity = *it;
            if (!activeSet.contains(entity)) {
                ++it;
                continue;
            }
            ++fixes;
            if (m_world.roleOf(entity) == Role::ActiveEnemy) {
                DIAG_LOG_WARN("Pool: active enemy {} was also pooled, removed from pool",
                              toIntegral(entity));
                it = m_inactive.erase(it);
            } else {
                DIAG_LOG_WARN("Pool: pooled entity {} was also active, removed from active set",
                              toIntegral(entity));
                activeSet.erase(entity);
                ++it;
            }
        }

        // Pool entries must hold Role::Pooled
        for (Entity entity : m_inactive) {
            Role role = m_world.roleOf(entity);
            if (role != Role::Pooled) {
                DIAG_LOG_WARN("Pool: entity {} had role '{}' while pooled", toIntegral(entity),
                              roleName(role));
                stash(entity);
                ++fixes;
            }
        }

        // Active-set entries must not hold Role::Pooled
        for (Entity entity : activeSet.snapshot()) {
            if (m_world.isAlive(entity) && m_world.roleOf(entity) == Role::Pooled) {
                DIAG_LOG_WARN("Pool: active set held pooled entity {}", toIntegral(entity));
                activeSet.erase(entity);
                if (m_inactive.size() < m_maxSize) {
                    m_inactive.push_back(entity);
                } else {
                    m_world.destroyEntity(entity);
                }
                ++fixes;
            }
        }
    } catch (const std::exception& ex) {
        DIAG_LOG_ERROR("Pool diagnostics aborted after {} fixes: {}", fixes, ex.what());
    }

    if (fixes > 0) {
        DIAG_LOG_INFO("Pool diagnostics applied {} fixes (pool {}, active {})", fixes,
                      m_inactive.size(), activeSet.size());
    }
    return fixes;
}

void EntityPool::clear() {
    for (Entity entity : m_inactive) {
        m_world.destroyEntity(entity);
    }
    m_inactive.clear();
}

bool EntityPool::contains(Entity entity) const {
    return std::find(m_inactive.begin(), m_inactive.end(), entity) != m_inactive.end();
}

Entity EntityPool::createBareEnemy() {
    Entity entity = m_world.createEntity(Role::None);
    auto& registry = m_world.registry();

    registry.add<Transform>(entity);
    registry.add<Rigidbody>(entity);
    registry.add<Health>(entity);
    registry.add<EnemyAI>(entity);
    registry.add<VariantState>(entity);
    auto& mesh = registry.add<RenderMesh>(entity);
    mesh.visible = false;
    return entity;
}

void EntityPool::stash(Entity entity) {
    auto& registry = m_world.registry();

    if (auto* trail = registry.tryGet<TrailEffect>(entity)) {
        if (trail->resourceId != 0 && !m_world.scene().disposeResource(trail->resourceId)) {
            LOG_DEBUG("EntityPool: trail resource {} was already disposed", trail->resourceId);
        }
        registry.remove<TrailEffect>(entity);
    }
    if (auto* body = registry.tryGet<Rigidbody>(entity)) {
        body->stop();
    }
    if (auto* health = registry.tryGet<Health>(entity)) {
        health->destroyed = true;
    }
    if (auto* mesh = registry.tryGet<RenderMesh>(entity)) {
        mesh->visible = false;
    }
    if (auto* ai = registry.tryGet<EnemyAI>(entity)) {
        ai->enabled = false;
    }
    registry.remove<Frozen>(entity);
    m_world.setRole(entity, Role::Pooled);
}

} // namespace spectral
