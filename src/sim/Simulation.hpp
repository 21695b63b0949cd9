#pragma once

#include "difficulty/TimedDifficultyManager.hpp"
#include "ecs/CoreSystems.hpp"
#include "ecs/Systems.hpp"
#include "ecs/World.hpp"
#include "engine/Settings.hpp"
#include "engine/TimerQueue.hpp"
#include "events/MessageBus.hpp"
#include "game/GameState.hpp"
#include "gameplay/CombatCollisionSystem.hpp"
#include "gameplay/EnemySystem.hpp"
#include "gameplay/HordeMode.hpp"
#include "gameplay/Leaderboard.hpp"
#include "render/MeshGeometry.hpp"

#include <memory>
#include <random>
#include <vector>

namespace spectral {

/// Player-side turret for headless runs: fires at the nearest active enemy
/// on a fixed cadence.
class AutoGunnerSystem : public System {
public:
    AutoGunnerSystem(World& world, MessageBus& bus, const SimulationSettings& settings,
                     const CombatSettings& combat);

    void update(float dt) override;

    /// Create a projectile at `origin` heading along `direction` and announce it
    Entity fire(const Vec3& origin, const Vec3& direction, Role role = Role::Projectile,
                Entity source = NullEntity);

    size_t shotsFired() const { return m_shotsFired; }

private:
    World& m_world;
    MessageBus& m_bus;
    float m_fireInterval;
    float m_projectileSpeed;
    float m_damage;
    float m_cooldown = 0.0f;
    size_t m_shotsFired = 0;
};

/// Totals reported at the end of a run
struct SimulationReport {
    float simulatedSeconds = 0.0f;
    size_t steps = 0;
    size_t enemiesSpawned = 0;
    size_t enemiesKilled = 0;
    size_t activeEnemies = 0;
    size_t shotsFired = 0;
    CombatStats combat;
    PoolStats pool;
    int difficultyLevel = 0;
    bool hordeMode = false;
    HordeRunSummary horde;
};

/// Headless game session: owns the world and every collaborator the enemy
/// pipeline is injected with, and drives them on a fixed timestep.
class Simulation {
public:
    explicit Simulation(const SpectralSettings& settings,
                        std::unique_ptr<IAssetLoader> assets = nullptr);
    ~Simulation();

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    /// Feed real elapsed time; runs as many fixed steps as have accumulated,
    /// capped per frame. Returns the number of steps run.
    int frame(float realDt);

    /// Advance exactly one fixed step
    void step();

    /// Run for `seconds` of simulated time (or until the game is over)
    SimulationReport run(float seconds);

    void activateHorde();
    HordeRunSummary endHorde();

    void dock();
    void undock();

    SimulationReport report() const;

    World& world() { return m_world; }
    MessageBus& bus() { return m_bus; }
    GameState& gameState() { return m_gameState; }
    TimerQueue& timers() { return m_timers; }
    EnemySystem& enemies() { return *m_enemies; }
    CombatCollisionSystem& combat() { return *m_combat; }
    AutoGunnerSystem& gunner() { return *m_gunner; }
    TimedDifficultyManager& difficulty() { return m_difficulty; }
    HordeMode& horde() { return m_horde; }
    Leaderboard& leaderboard() { return m_leaderboard; }
    Entity player() const { return m_player; }
    float simulatedTime() const { return m_simulatedTime; }
    size_t stepCount() const { return m_steps; }

private:
    Entity createPlayer();

    SpectralSettings m_settings;
    std::unique_ptr<IAssetLoader> m_assets;

    World m_world;
    MessageBus m_bus;
    GameState m_gameState;
    TimerQueue m_timers;
    TimedDifficultyManager m_difficulty;
    PersistentStore m_store;
    Leaderboard m_leaderboard;
    HordeMode m_horde;

    // Declared after everything the systems reference, so it is torn down first
    SystemScheduler m_scheduler;
    EnemySystem* m_enemies = nullptr;
    CombatCollisionSystem* m_combat = nullptr;
    AutoGunnerSystem* m_gunner = nullptr;

    Entity m_player = NullEntity;
    SubscriptionId m_destroyedSub = 0;
    HordeRunSummary m_lastRun;

    float m_accumulator = 0.0f;
    float m_simulatedTime = 0.0f;
    size_t m_steps = 0;
};

} // namespace spectral
