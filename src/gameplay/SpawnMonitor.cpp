#include "gameplay/SpawnMonitor.hpp"
#include "engine/Log.hpp"

#include <algorithm>

namespace spectral {

SpawnMonitor::SpawnMonitor(EnemySpawner& spawner, const ActiveEnemySet& activeSet, const EnemyConfig& config,
                           const GameState& gameState, const MonitorSettings& settings)
    : m_spawner(spawner)
    , m_activeSet(activeSet)
    , m_config(config)
    , m_gameState(gameState)
    , m_settings(settings) {
}

void SpawnMonitor::start(TimerQueue& timers) {
    if (m_timerId != InvalidTimerId) return;
    m_lastCount = m_activeSet.size();
    m_timerId = timers.every(m_settings.watchdogInterval, [this]() { check(); });
}

void SpawnMonitor::stop(TimerQueue& timers) {
    if (m_timerId == InvalidTimerId) return;
    timers.cancel(m_timerId);
    m_timerId = InvalidTimerId;
}

bool SpawnMonitor::check() {
    ++m_checks;
    const size_t count = m_activeSet.size();
    const bool grew = count > m_lastCount;
    m_lastCount = count;

    // Spawning is intentionally halted while docked or paused
    if (m_gameState.docked || m_spawner.isPaused()) {
        return false;
    }

    const float interval = m_spawner.spawnInterval();
    const float idle = m_spawner.timeSinceLastSpawn();
    const size_t cap = static_cast<size_t>(std::max(0, m_config.maxEnemies));

    if (idle <= m_settings.stallFactor * interval || count >= cap || grew) {
        DIAG_LOG_DEBUG("SpawnMonitor: ok ({} / {} enemies, {:.1f}s since last spawn)", count, cap, idle);
        return false;
    }

    DIAG_LOG_WARN("SpawnMonitor: spawner stalled for {:.1f}s (interval {:.2f}s, {} / {} enemies), forcing recovery",
                  idle, interval, count, cap);
    m_spawner.resetSpawnPoints();
    m_spawner.generateSpawnPoints();
    m_spawner.forceTimer(interval);
    ++m_recoveries;
    return true;
}

} // namespace spectral
