#pragma once

#include "difficulty/IDifficultySource.hpp"
#include "gameplay/EnemyConfig.hpp"

namespace spectral {

/// Rewrites the shared EnemyConfig every tick, either from an external
/// difficulty source or, in horde mode, from survival time.
///
/// Horde curve over elapsed minutes m:
///   maxEnemies    = 50 + 10m for the first 5 minutes, then 100 * 1.2^(m-5),
///                   never above HORDE_MAX_ENEMIES
///   spawnInterval = max(0.2, 0.95^(2m))
///   health, damage and speed grow linearly with m
class DifficultyScaling {
public:
    static constexpr int HORDE_MAX_ENEMIES = 300;
    static constexpr float HORDE_MIN_SPAWN_INTERVAL = 0.2f;
    static constexpr float HORDE_LINEAR_PHASE_MINUTES = 5.0f;

    explicit DifficultyScaling(EnemyConfig& config) : m_config(config) {}

    /// External source used outside horde mode; may be null
    void setSource(const IDifficultySource* source) { m_source = source; }
    const IDifficultySource* source() const { return m_source; }

    /// Recompute the config for this tick
    void update(bool hordeActive, float survivalSeconds);

    static void applyHordeCurve(EnemyConfig& config, float survivalSeconds);
    static void applyParams(EnemyConfig& config, const DifficultyParams& params);

    static int hordeMaxEnemies(float minutes);
    static float hordeSpawnInterval(float minutes);

private:
    EnemyConfig& m_config;
    const IDifficultySource* m_source = nullptr;
};

} // namespace spectral
