#pragma once

#include "ecs/World.hpp"
#include "engine/Settings.hpp"
#include "events/MessageBus.hpp"
#include "game/GameState.hpp"
#include "gameplay/ActiveEnemySet.hpp"
#include "gameplay/EnemyConfig.hpp"
#include "gameplay/EntityPool.hpp"
#include "render/MeshGeometry.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <vector>

namespace spectral {

/// Spawn callback used by EnemySpawner::update. Returns NullEntity on failure.
using SpawnFn = std::function<Entity(const Vec3&)>;

/// Places spectral drones on a sphere around the player and configures them
/// from the shared EnemyConfig.
class EnemySpawner {
public:
    EnemySpawner(World& world, MessageBus& bus, GameState& gameState, IAssetLoader& assets,
                 const SpawnerSettings& settings, const EnemyConfig& config);

    /// Player position from, in order: an entity with Role::Player, the
    /// world's registered player, the game state's ship position.
    std::optional<Vec3> resolvePlayerPosition();

    /// Sample spawn points uniformly on a sphere around the player, or on a
    /// ring around the origin when no player position resolves.
    const std::vector<Vec3>& generateSpawnPoints();

    /// Uniform pick from the spawn points, regenerating them when empty or
    /// when the player has left the zone they were generated for.
    Vec3 getRandomSpawnPoint();

    /// Spawn one configured drone. Returns NullEntity, without touching the
    /// pool, if the active set is already at maxEnemies.
    Entity spawnSpectralDrone(const Vec3& position, EntityPool& pool, ActiveEnemySet& activeSet,
                              int maxEnemies);

    /// Advance the spawn timer; once past the spawn interval and under the
    /// cap, call spawnFn. The timer resets only when spawnFn succeeds.
    /// @return true if an enemy was spawned
    bool update(float dt, const ActiveEnemySet& activeSet, int maxEnemies, const SpawnFn& spawnFn);

    /// Current spawn interval, clamped to the configured bounds
    float spawnInterval() const;

    void setPaused(bool paused) { m_paused = paused; }
    bool isPaused() const { return m_paused; }

    float timer() const { return m_timer; }
    void forceTimer(float value) { m_timer = value; }
    float timeSinceLastSpawn() const { return m_timeSinceLastSpawn; }

    /// Drop the spawn points so the next pick regenerates them
    void resetSpawnPoints();

    const std::vector<Vec3>& spawnPoints() const { return m_spawnPoints; }
    size_t spawnCount() const { return m_spawnCount; }
    bool usingPlaceholderMesh() const { return m_modelLoadAttempted && !m_loadedModel; }

    void seed(unsigned int value) { m_rng.seed(value); }

private:
    /// Loaded drone model, or the procedural placeholder if loading failed.
    /// Only the first call touches the asset loader.
    std::shared_ptr<const MeshGeometry> droneGeometry();

    bool zoneChanged(const std::optional<Vec3>& playerPos) const;

    World& m_world;
    MessageBus& m_bus;
    GameState& m_gameState;
    IAssetLoader& m_assets;
    SpawnerSettings m_settings;
    const EnemyConfig& m_config;

    std::vector<Vec3> m_spawnPoints;
    std::optional<Vec3> m_generationCenter;  ///< Player position the points were sampled around

    float m_timer = 0.0f;
    float m_elapsed = 0.0f;
    float m_timeSinceLastSpawn = 0.0f;
    bool m_paused = false;
    size_t m_spawnCount = 0;

    bool m_modelLoadAttempted = false;
    std::shared_ptr<const MeshGeometry> m_loadedModel;
    std::shared_ptr<const MeshGeometry> m_placeholder;

    std::mt19937 m_rng{std::random_device{}()};
};

} // namespace spectral
