#include "gameplay/CombatCollisionSystem.hpp"
#include "engine/Log.hpp"
#include "events/Events.hpp"
#include "physics/Raycast.hpp"

#include <limits>

namespace spectral {

namespace {

constexpr uint32_t kHitColor = 0xff5500;
constexpr uint32_t kShieldHitColor = 0x3399ff;
constexpr uint32_t kCriticalHitColor = 0xff0000;

bool isProjectileRole(Role role) {
    return role == Role::Projectile || role == Role::EnemyProjectile;
}

} // namespace

CombatCollisionSystem::CombatCollisionSystem(World& world, MessageBus& bus, const CombatSettings& settings)
    : System("CombatCollisionSystem", 50)
    , m_world(world)
    , m_bus(bus)
    , m_settings(settings)
    , m_hitEffects(world, settings) {
    auto onFired = [this](const EventData& data) {
        trackProjectile(data.getEntity("projectile"));
        return false;
    };
    m_subscriptions.push_back(m_bus.subscribe(events::WeaponFired, onFired));
    m_subscriptions.push_back(m_bus.subscribe(events::TurretFire, onFired));
    m_subscriptions.push_back(m_bus.subscribe(events::MissileFired, onFired));

    m_subscriptions.push_back(m_bus.subscribe(events::EntityDamaged, [this](const EventData& data) {
        float amount = data.getFloat("amount");
        if (m_world.roleOf(data.getEntity("target")) == Role::Player) {
            m_stats.damageReceived += amount;
        } else {
            m_stats.damageDealt += amount;
        }
        return false;
    }));
}

CombatCollisionSystem::~CombatCollisionSystem() {
    for (SubscriptionId id : m_subscriptions) {
        m_bus.unsubscribe(id);
    }
    m_hitEffects.clear();
}

void CombatCollisionSystem::trackProjectile(Entity projectile) {
    if (!m_world.isAlive(projectile) || !isProjectileRole(m_world.roleOf(projectile))) {
        LOG_DEBUG("CombatCollisionSystem: ignoring non-projectile {}", toIntegral(projectile));
        return;
    }
    if (m_tracked.insert(projectile).second) {
        ++m_stats.projectilesTracked;
    }
}

CombatCollisionSystem::Buckets CombatCollisionSystem::partition() {
    Buckets buckets;
    m_world.registry().each<EntityRole>([&buckets](Entity entity, const EntityRole& role) {
        switch (role.role) {
            case Role::ActiveEnemy:     buckets.enemies.push_back(entity); break;
            case Role::Player:          buckets.players.push_back(entity); break;
            case Role::Projectile:
            case Role::EnemyProjectile: buckets.projectiles.push_back(entity); break;
            default: break;
        }
    });
    return buckets;
}

void CombatCollisionSystem::update(float dt) {
    Buckets buckets = partition();
    for (Entity projectile : buckets.projectiles) {
        trackProjectile(projectile);
    }

    int hits = 0;
    std::vector<Entity> tracked(m_tracked.begin(), m_tracked.end());
    for (Entity projectile : tracked) {
        // Destroyed by another system (lifetime expiry, weapon cleanup)
        if (!m_world.isAlive(projectile) || !isProjectileRole(m_world.roleOf(projectile))) {
            m_tracked.erase(projectile);
            continue;
        }

        try {
            if (processProjectile(projectile, buckets)) {
                ++hits;
            }
        } catch (const std::exception& ex) {
            LOG_ERROR("CombatCollisionSystem: projectile {} failed: {}", toIntegral(projectile), ex.what());
        }
    }

    m_hitEffects.update(dt);
    m_lastTickHits = hits;
}

bool CombatCollisionSystem::processProjectile(Entity projectile, const Buckets& buckets) {
    auto& registry = m_world.registry();
    const auto* transform = registry.tryGet<Transform>(projectile);
    const auto* body = registry.tryGet<Rigidbody>(projectile);
    if (!transform || !body) {
        LOG_WARN("CombatCollisionSystem: projectile {} has no {}, skipped", toIntegral(projectile),
                 transform ? "Rigidbody" : "Transform");
        return false;
    }

    // Resting projectiles stay tracked; their lifetime belongs to the weapon
    const Vec3 velocity = body->linearVelocity;
    if (velocity.lengthSquared() < m_settings.minVelocitySq) {
        return false;
    }

    const Vec3 direction = velocity.normalized();
    const Ray ray(transform->position - direction * m_settings.rayBackOffset, direction);

    const Role side = m_world.roleOf(projectile);
    const auto& candidates = side == Role::Projectile ? buckets.enemies : buckets.players;
    const Role targetRole = side == Role::Projectile ? Role::ActiveEnemy : Role::Player;
    const auto* data = registry.tryGet<ProjectileData>(projectile);
    const Entity source = data ? data->source : NullEntity;

    Entity bestTarget = NullEntity;
    RaycastHit bestHit;
    float bestDistance = std::numeric_limits<float>::max();

    for (Entity candidate : candidates) {
        if (candidate == source) continue;
        // A hit earlier this tick may already have destroyed or recycled it
        if (m_world.roleOf(candidate) != targetRole) continue;

        const auto* health = registry.tryGet<Health>(candidate);
        if (health && health->isDestroyed()) continue;

        const auto* mesh = registry.tryGet<RenderMesh>(candidate);
        const auto* pose = registry.tryGet<Transform>(candidate);
        if (!mesh || !pose || !mesh->visible || !mesh->geometry) continue;

        MeshPose meshPose{pose->position, pose->rotation, pose->scale};
        RaycastHit hit = Raycast::raycastMesh(ray, *mesh->geometry, meshPose, m_settings.rayLength);
        if (hit && hit.distance < bestDistance) {
            bestDistance = hit.distance;
            bestHit = hit;
            bestTarget = candidate;
        }
    }

    if (bestTarget == NullEntity) {
        return false;
    }

    applyHit(projectile, bestTarget, bestHit.point);

    m_tracked.erase(projectile);
    m_world.destroyEntity(projectile);
    ++m_stats.projectilesDestroyed;
    return true;
}

void CombatCollisionSystem::applyHit(Entity projectile, Entity target, const Vec3& point) {
    auto& registry = m_world.registry();
    const auto* data = registry.tryGet<ProjectileData>(projectile);
    const float damage = data ? data->damage : m_settings.defaultDamage;
    const Entity source = data ? data->source : NullEntity;
    const bool targetIsEnemy = m_world.roleOf(target) == Role::ActiveEnemy;

    DamageResult result;
    if (auto* health = registry.tryGet<Health>(target)) {
        result = health->applyDamage(damage);
    } else {
        LOG_WARN("CombatCollisionSystem: target {} has no Health", toIntegral(target));
    }

    ++m_stats.hits;
    if (targetIsEnemy) {
        m_stats.damageDealt += result.damageApplied;
    } else {
        m_stats.damageReceived += result.damageApplied;
    }

    EventData hit;
    hit.setEntity("projectile", projectile);
    hit.setEntity("target", target);
    hit.setFloat("damage", result.damageApplied);
    hit.setFloat("shieldDamage", result.shieldDamage);
    hit.setFloat("healthDamage", result.healthDamage);
    hit.setBool("destroyed", result.destroyed);
    hit.setVec3("", point);
    m_bus.publish(events::CombatHit, hit);

    uint32_t color = kHitColor;
    float size = 1.0f;
    if (result.healthDamage > m_settings.criticalThreshold) {
        color = kCriticalHitColor;
        size = 2.0f;
    } else if (result.shieldDamage > 0.0f) {
        color = kShieldHitColor;
        size = 1.5f;
    }
    m_hitEffects.spawn(point, color, size);

    if (result.destroyed) {
        if (targetIsEnemy) {
            ++m_stats.enemiesDestroyed;
        }
        EventData destroyed;
        destroyed.setEntity("entity", target);
        destroyed.setEntity("source", source);
        destroyed.setBool("enemy", targetIsEnemy);
        destroyed.setVec3("", point);
        m_bus.publish(events::EntityDestroyed, destroyed);
    }

    LOG_TRACE("CombatCollisionSystem: {} hit {} for {:.1f} (shield {:.1f}, hull {:.1f}){}",
              toIntegral(projectile), toIntegral(target), result.damageApplied,
              result.shieldDamage, result.healthDamage, result.destroyed ? " destroyed" : "");
}

} // namespace spectral
