#pragma once

#include "ecs/World.hpp"
#include "events/MessageBus.hpp"
#include "gameplay/ActiveEnemySet.hpp"

#include <functional>
#include <optional>

namespace spectral {

/// Returns an enemy to wherever it came from (normally the pool)
using ReleaseFn = std::function<void(Entity)>;

/// Keeps the active set consistent with entity roles and drives the
/// per-tick update of every live enemy.
class EnemyLifecycle {
public:
    /// Seconds between elite particle pulses
    static constexpr float ELITE_PULSE_INTERVAL = 1.5f;

    EnemyLifecycle(World& world, MessageBus& bus);

    /// Drop stale or non-enemy entries from the set and adopt live
    /// Role::ActiveEnemy entities missing from it.
    /// @return number of corrections
    int validateEnemyReferences(ActiveEnemySet& activeSet);

    /// Stop every active enemy and disable its AI, remembering the previous
    /// AI-enabled flag. @return number of enemies newly frozen
    int freezeAllEnemies(const ActiveEnemySet& activeSet);

    /// Restore the AI-enabled flag saved by freezeAllEnemies().
    /// @return number of enemies unfrozen
    int unfreezeAllEnemies(const ActiveEnemySet& activeSet);

    /// Remove the oldest enemies until the set is within maxEnemies, then
    /// re-validate. Without a releaseFn removed enemies are destroyed.
    /// @return number of enemies removed
    int enforceEnemyLimit(ActiveEnemySet& activeSet, int maxEnemies, const ReleaseFn& releaseFn);

    /// Scene attachment, transform mirroring, variant animation, AI and
    /// shield regeneration for one enemy.
    /// @return false if the entity was skipped
    bool processEntityUpdate(Entity entity, float dt);

    /// Position enemies steer towards this tick; nullopt leaves them drifting
    void setPursuitTarget(std::optional<Vec3> target) { m_target = target; }

    size_t sceneAttachCount() const { return m_sceneAttachCount; }

private:
    World& m_world;
    MessageBus& m_bus;
    std::optional<Vec3> m_target;
    size_t m_sceneAttachCount = 0;
};

} // namespace spectral
