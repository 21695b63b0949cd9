#pragma once

#include <string>

namespace spectral {

class Config;

struct PoolSettings {
    int maxPoolSize = 20;        ///< Released entities beyond this are destroyed
    int initialSize = 10;        ///< Entities created by the deferred warm-up
    float warmupDelay = 0.0f;    ///< Seconds before the warm-up timer fires
};

struct SpawnerSettings {
    int spawnPointCount = 12;
    float spawnRadius = 2500.0f;         ///< Sphere radius around the player
    float fallbackRadius = 2000.0f;      ///< Ring radius around the origin when no player resolves
    float fallbackHeightJitter = 250.0f;
    float zoneChangeDistance = 1000.0f;  ///< Player travel that invalidates spawn points
    float initialDelay = 0.0f;           ///< Seconds before the first spawn may happen
    float minInterval = 0.2f;
    float maxInterval = 10.0f;
    int killsPerPointRefresh = 5;
    std::string modelPath = "models/spectral_drone.glb";
};

struct CombatSettings {
    float rayBackOffset = 10.0f;      ///< Ray origin distance behind the projectile
    float rayLength = 120.0f;         ///< Forward extent of the hit ray
    float defaultDamage = 10.0f;
    float minVelocitySq = 0.1f;
    float criticalThreshold = 20.0f;  ///< Hull damage above this is a critical hit
    int hitEffectPoolSize = 20;
    float hitEffectDuration = 0.25f;
};

struct MonitorSettings {
    float watchdogInterval = 10.0f;
    float diagnosticsInterval = 3.0f;
    float stallFactor = 3.0f;         ///< Stalled once idle for this many spawn intervals
};

struct HordeSettings {
    std::string leaderboardPath = "horde_scores.json";
    int leaderboardSize = 5;
};

struct SimulationSettings {
    float fixedTimestep = 1.0f / 60.0f;
    int maxStepsPerFrame = 5;
    float duration = 120.0f;
    bool hordeMode = false;
    float fireInterval = 0.25f;
    float projectileSpeed = 3000.0f;
    unsigned int seed = 0;            ///< 0 picks a random seed
};

struct LoggingSettings {
    std::string level = "info";
    std::string file;
};

/// All tunables of the enemy pipeline, with built-in defaults.
struct SpectralSettings {
    PoolSettings pool;
    SpawnerSettings spawner;
    CombatSettings combat;
    MonitorSettings monitor;
    HordeSettings horde;
    SimulationSettings simulation;
    LoggingSettings logging;

    /// Read every known key from the config; absent keys keep their defaults.
    static SpectralSettings fromConfig(const Config& config);
};

} // namespace spectral
