#include "gameplay/EnemyLifecycle.hpp"
#include "engine/Log.hpp"
#include "events/Events.hpp"

#include <algorithm>
#include <cmath>

namespace spectral {

EnemyLifecycle::EnemyLifecycle(World& world, MessageBus& bus)
    : m_world(world)
    , m_bus(bus) {
}

int EnemyLifecycle::validateEnemyReferences(ActiveEnemySet& activeSet) {
    int corrections = 0;

    for (Entity entity : activeSet.snapshot()) {
        if (!m_world.isAlive(entity)) {
            activeSet.erase(entity);
            DIAG_LOG_DEBUG("Lifecycle: dropped destroyed enemy {}", toIntegral(entity));
            ++corrections;
            continue;
        }
        Role role = m_world.roleOf(entity);
        if (role != Role::ActiveEnemy) {
            activeSet.erase(entity);
            DIAG_LOG_WARN("Lifecycle: dropped entity {} with role '{}' from active set",
                          toIntegral(entity), roleName(role));
            ++corrections;
        }
    }

    for (Entity entity : m_world.entitiesWithRole(Role::ActiveEnemy)) {
        if (!activeSet.contains(entity)) {
            activeSet.insert(entity);
            DIAG_LOG_WARN("Lifecycle: re-tracked untracked enemy {}", toIntegral(entity));
            ++corrections;
        }
    }

    return corrections;
}

int EnemyLifecycle::freezeAllEnemies(const ActiveEnemySet& activeSet) {
    auto& registry = m_world.registry();
    int frozen = 0;

    for (Entity entity : activeSet) {
        if (m_world.roleOf(entity) != Role::ActiveEnemy) continue;

        if (auto* body = registry.tryGet<Rigidbody>(entity)) {
            body->stop();
        }
        if (registry.has<Frozen>(entity)) continue;

        auto* ai = registry.tryGet<EnemyAI>(entity);
        bool wasEnabled = ai ? ai->enabled : false;
        if (ai) ai->enabled = false;
        registry.add<Frozen>(entity, wasEnabled);
        ++frozen;
    }

    LOG_INFO("EnemyLifecycle: froze {} enemies", frozen);
    return frozen;
}

int EnemyLifecycle::unfreezeAllEnemies(const ActiveEnemySet& activeSet) {
    auto& registry = m_world.registry();
    int thawed = 0;

    for (Entity entity : activeSet) {
        auto* frozen = registry.tryGet<Frozen>(entity);
        if (!frozen) continue;

        bool restore = frozen->savedAiEnabled;
        if (auto* ai = registry.tryGet<EnemyAI>(entity)) {
            ai->enabled = restore;
        }
        registry.remove<Frozen>(entity);
        ++thawed;
    }

    LOG_INFO("EnemyLifecycle: unfroze {} enemies", thawed);
    return thawed;
}

int EnemyLifecycle::enforceEnemyLimit(ActiveEnemySet& activeSet, int maxEnemies,
                                      const ReleaseFn& releaseFn) {
    const size_t cap = static_cast<size_t>(std::max(0, maxEnemies));
    int removed = 0;

    while (activeSet.size() > cap) {
        Entity oldest = activeSet.oldest();
        activeSet.erase(oldest);

        if (auto pos = m_world.positionOf(oldest)) {
            EventData data;
            data.setVec3("", *pos);
            data.setFloat("scale", 1.0f);
            data.setFloat("duration", 1.0f);
            m_bus.publish(events::VfxExplosion, data);
        }

        if (releaseFn) {
            releaseFn(oldest);
        } else {
            m_world.destroyEntity(oldest);
        }
        ++removed;
    }

    if (removed > 0) {
        LOG_INFO("EnemyLifecycle: removed {} enemies over the cap of {}", removed, maxEnemies);
        validateEnemyReferences(activeSet);
    }
    return removed;
}

bool EnemyLifecycle::processEntityUpdate(Entity entity, float dt) {
    if (!m_world.isAlive(entity)) {
        LOG_WARN("EnemyLifecycle: update for destroyed entity {}", toIntegral(entity));
        return false;
    }

    auto& registry = m_world.registry();
    auto* transform = registry.tryGet<Transform>(entity);
    auto* mesh = registry.tryGet<RenderMesh>(entity);
    if (!transform || !mesh) {
        LOG_WARN("EnemyLifecycle: entity {} is missing {}, skipped", toIntegral(entity),
                 transform ? "RenderMesh" : "Transform");
        return false;
    }

    if (!mesh->attached) {
        if (m_world.scene().attach(entity)) {
            ++m_sceneAttachCount;
        }
        mesh->attached = true;
    }

    mesh->position = transform->position;
    mesh->rotation = transform->rotation;
    mesh->scale = transform->scale;

    if (auto* state = registry.tryGet<VariantState>(entity)) {
        state->effectTime += dt;
        switch (state->variant) {
            case VisualVariant::Elite:
                mesh->childAnimationTime += dt;
                state->pulseTimer += dt;
                if (state->pulseTimer >= ELITE_PULSE_INTERVAL) {
                    state->pulseTimer -= ELITE_PULSE_INTERVAL;
                    EventData data;
                    data.setEntity("entity", entity);
                    data.setVec3("", transform->position);
                    data.setInt("color", 0xaaffff);
                    data.setFloat("scale", 0.7f);
                    data.setFloat("duration", 0.8f);
                    m_bus.publish(events::VfxPulse, data);
                }
                break;
            case VisualVariant::Overcharged:
                mesh->childAnimationTime += dt;
                break;
            case VisualVariant::Damaged:
                mesh->emissiveIntensity = 0.5f + std::sin(state->effectTime * 10.0f) * 0.3f;
                break;
            case VisualVariant::Standard:
                break;
        }
    }

    auto* ai = registry.tryGet<EnemyAI>(entity);
    auto* body = registry.tryGet<Rigidbody>(entity);
    if (ai && body) {
        if (!registry.has<Frozen>(entity)) {
            ai->update(dt, *transform, *body, m_target ? &*m_target : nullptr);
        }
    } else {
        LOG_DEBUG("EnemyLifecycle: entity {} has no AI or rigidbody", toIntegral(entity));
    }

    if (auto* health = registry.tryGet<Health>(entity)) {
        health->update(dt);
    }

    return true;
}

} // namespace spectral
