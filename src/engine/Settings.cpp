#include "engine/Settings.hpp"
#include "engine/Config.hpp"
#include "engine/Log.hpp"

#include <algorithm>

namespace spectral {

SpectralSettings SpectralSettings::fromConfig(const Config& config) {
    SpectralSettings s;

    s.pool.maxPoolSize = config.getInt("pool.maxPoolSize", s.pool.maxPoolSize);
    s.pool.initialSize = config.getInt("pool.initialSize", s.pool.initialSize);
    s.pool.warmupDelay = config.getFloat("pool.warmupDelay", s.pool.warmupDelay);
    if (s.pool.initialSize > s.pool.maxPoolSize) {
        LOG_WARN("Settings: pool.initialSize {} exceeds pool.maxPoolSize {}, clamping",
                 s.pool.initialSize, s.pool.maxPoolSize);
        s.pool.initialSize = s.pool.maxPoolSize;
    }

    s.spawner.spawnPointCount = std::max(1, config.getInt("spawner.spawnPointCount", s.spawner.spawnPointCount));
    s.spawner.spawnRadius = config.getFloat("spawner.spawnRadius", s.spawner.spawnRadius);
    s.spawner.fallbackRadius = config.getFloat("spawner.fallbackRadius", s.spawner.fallbackRadius);
    s.spawner.fallbackHeightJitter = config.getFloat("spawner.fallbackHeightJitter", s.spawner.fallbackHeightJitter);
    s.spawner.zoneChangeDistance = config.getFloat("spawner.zoneChangeDistance", s.spawner.zoneChangeDistance);
    s.spawner.initialDelay = config.getFloat("spawner.initialDelay", s.spawner.initialDelay);
    s.spawner.minInterval = config.getFloat("spawner.minInterval", s.spawner.minInterval);
    s.spawner.maxInterval = config.getFloat("spawner.maxInterval", s.spawner.maxInterval);
    s.spawner.killsPerPointRefresh = config.getInt("spawner.killsPerPointRefresh", s.spawner.killsPerPointRefresh);
    s.spawner.modelPath = config.getString("spawner.modelPath", s.spawner.modelPath);

    s.combat.rayBackOffset = config.getFloat("combat.rayBackOffset", s.combat.rayBackOffset);
    s.combat.rayLength = config.getFloat("combat.rayLength", s.combat.rayLength);
    s.combat.defaultDamage = config.getFloat("combat.defaultDamage", s.combat.defaultDamage);
    s.combat.minVelocitySq = config.getFloat("combat.minVelocitySq", s.combat.minVelocitySq);
    s.combat.criticalThreshold = config.getFloat("combat.criticalThreshold", s.combat.criticalThreshold);
    s.combat.hitEffectPoolSize = config.getInt("combat.hitEffectPoolSize", s.combat.hitEffectPoolSize);
    s.combat.hitEffectDuration = config.getFloat("combat.hitEffectDuration", s.combat.hitEffectDuration);

    s.monitor.watchdogInterval = config.getFloat("monitor.watchdogInterval", s.monitor.watchdogInterval);
    s.monitor.diagnosticsInterval = config.getFloat("monitor.diagnosticsInterval", s.monitor.diagnosticsInterval);
    s.monitor.stallFactor = config.getFloat("monitor.stallFactor", s.monitor.stallFactor);

    s.horde.leaderboardPath = config.getString("horde.leaderboardPath", s.horde.leaderboardPath);
    s.horde.leaderboardSize = config.getInt("horde.leaderboardSize", s.horde.leaderboardSize);

    s.simulation.fixedTimestep = config.getFloat("simulation.fixedTimestep", s.simulation.fixedTimestep);
    s.simulation.maxStepsPerFrame = config.getInt("simulation.maxStepsPerFrame", s.simulation.maxStepsPerFrame);
    s.simulation.duration = config.getFloat("simulation.duration", s.simulation.duration);
    s.simulation.hordeMode = config.getBool("simulation.hordeMode", s.simulation.hordeMode);
    s.simulation.fireInterval = config.getFloat("simulation.fireInterval", s.simulation.fireInterval);
    s.simulation.projectileSpeed = config.getFloat("simulation.projectileSpeed", s.simulation.projectileSpeed);
    s.simulation.seed = static_cast<unsigned int>(config.getInt("simulation.seed", 0));
    if (s.simulation.fixedTimestep <= 0.0f) {
        LOG_WARN("Settings: simulation.fixedTimestep must be > 0, using 1/60");
        s.simulation.fixedTimestep = 1.0f / 60.0f;
    }

    s.logging.level = config.getString("logging.level", s.logging.level);
    s.logging.file = config.getString("logging.file", s.logging.file);

    return s;
}

} // namespace spectral
