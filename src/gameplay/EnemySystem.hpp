#pragma once

#include "difficulty/IDifficultySource.hpp"
#include "ecs/Systems.hpp"
#include "ecs/World.hpp"
#include "engine/Settings.hpp"
#include "engine/TimerQueue.hpp"
#include "events/MessageBus.hpp"
#include "game/GameState.hpp"
#include "gameplay/ActiveEnemySet.hpp"
#include "gameplay/DifficultyScaling.hpp"
#include "gameplay/EnemyConfig.hpp"
#include "gameplay/EnemyLifecycle.hpp"
#include "gameplay/EnemySpawner.hpp"
#include "gameplay/EntityPool.hpp"
#include "gameplay/HordeMode.hpp"
#include "gameplay/SpawnMonitor.hpp"

#include <vector>

namespace spectral {

/// Owns the enemy pipeline: pool, active set, spawner, lifecycle, difficulty
/// scaling and the spawn watchdog.
///
/// Per tick: recompute the enemy config, enforce the population cap, run the
/// timed spawn check, then update every live enemy. While the player is
/// docked all enemies are frozen and nothing spawns. Pool warm-up, the
/// watchdog and the diagnostics pass run from the timer queue.
class EnemySystem : public System {
public:
    EnemySystem(World& world, MessageBus& bus, GameState& gameState, TimerQueue& timers,
                IAssetLoader& assets, const SpectralSettings& settings,
                HordeMode* horde = nullptr, const IDifficultySource* difficulty = nullptr);
    ~EnemySystem() override;

    void update(float dt) override;
    void shutdown() override;

    // --- Cutscene / docking control ---
    int freezeAllEnemies();
    int unfreezeAllEnemies();
    bool isFrozen() const { return m_frozen; }

    // --- Operational tooling ---
    int runPoolDiagnostics() { return m_pool.runDiagnostics(m_active); }
    int validateEnemyReferences() { return m_lifecycle.validateEnemyReferences(m_active); }

    /// Pool diagnostics plus reference validation, as the periodic pass runs it
    int runDiagnosticsPass();

    /// Spawn one enemy immediately with the current config
    Entity spawnEnemyAt(const Vec3& position);

    /// Take an enemy out of the active set and return it to the pool
    void releaseEnemy(Entity entity);

    size_t activeCount() const { return m_active.size(); }
    size_t killCount() const { return m_kills; }

    EnemyConfig& config() { return m_config; }
    const EnemyConfig& config() const { return m_config; }
    ActiveEnemySet& activeEnemies() { return m_active; }
    EntityPool& pool() { return m_pool; }
    EnemySpawner& spawner() { return m_spawner; }
    EnemyLifecycle& lifecycle() { return m_lifecycle; }
    SpawnMonitor& monitor() { return m_monitor; }
    DifficultyScaling& scaling() { return m_scaling; }

private:
    void onEntityDestroyed(const EventData& data);

    World& m_world;
    MessageBus& m_bus;
    GameState& m_gameState;
    TimerQueue& m_timers;
    SpectralSettings m_settings;

    EnemyConfig m_config;
    ActiveEnemySet m_active;
    EntityPool m_pool;
    EnemySpawner m_spawner;
    EnemyLifecycle m_lifecycle;
    DifficultyScaling m_scaling;
    SpawnMonitor m_monitor;
    HordeMode* m_horde;

    TimerId m_warmupTimer = InvalidTimerId;
    TimerId m_diagnosticsTimer = InvalidTimerId;
    std::vector<SubscriptionId> m_subscriptions;

    size_t m_kills = 0;
    bool m_frozen = false;
    bool m_shutdown = false;
};

} // namespace spectral
