#pragma once

#include "ecs/Systems.hpp"
#include "ecs/World.hpp"
#include "engine/Settings.hpp"
#include "events/MessageBus.hpp"
#include "gameplay/HitEffectPool.hpp"

#include <unordered_set>
#include <vector>

namespace spectral {

/// Running combat totals
struct CombatStats {
    size_t hits = 0;
    size_t projectilesTracked = 0;
    size_t projectilesDestroyed = 0;
    size_t enemiesDestroyed = 0;
    float damageDealt = 0.0f;      ///< Damage applied to enemies
    float damageReceived = 0.0f;   ///< Damage applied to players
};

/// Ray-based hit detection between projectiles and the opposing faction.
///
/// Each tick every tracked projectile with a non-trivial velocity casts a
/// short ray starting slightly behind it along its velocity against the
/// visible geometry of its targets. The closest hit takes the damage and
/// the projectile is destroyed; at most one target per projectile per tick.
class CombatCollisionSystem : public System {
public:
    CombatCollisionSystem(World& world, MessageBus& bus, const CombatSettings& settings);
    ~CombatCollisionSystem() override;

    CombatCollisionSystem(const CombatCollisionSystem&) = delete;
    CombatCollisionSystem& operator=(const CombatCollisionSystem&) = delete;

    /// Run one collision pass and advance hit effects
    void update(float dt) override;

    /// Hits resolved by the most recent update()
    int lastTickHits() const { return m_lastTickHits; }

    void trackProjectile(Entity projectile);
    bool isTracked(Entity projectile) const { return m_tracked.count(projectile) > 0; }
    size_t trackedCount() const { return m_tracked.size(); }

    const CombatStats& stats() const { return m_stats; }
    HitEffectPool& hitEffects() { return m_hitEffects; }

private:
    struct Buckets {
        std::vector<Entity> enemies;
        std::vector<Entity> players;
        std::vector<Entity> projectiles;
    };

    Buckets partition();

    /// @return true if the projectile hit something and was destroyed
    bool processProjectile(Entity projectile, const Buckets& buckets);

    void applyHit(Entity projectile, Entity target, const Vec3& point);

    World& m_world;
    MessageBus& m_bus;
    CombatSettings m_settings;
    HitEffectPool m_hitEffects;
    CombatStats m_stats;
    int m_lastTickHits = 0;
    std::unordered_set<Entity> m_tracked;
    std::vector<SubscriptionId> m_subscriptions;
};

} // namespace spectral
