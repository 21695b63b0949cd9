#pragma once

#include "engine/Settings.hpp"
#include "engine/TimerQueue.hpp"
#include "game/GameState.hpp"
#include "gameplay/ActiveEnemySet.hpp"
#include "gameplay/EnemyConfig.hpp"
#include "gameplay/EnemySpawner.hpp"

namespace spectral {

/// Watchdog for a stalled spawner. Runs from the timer queue, outside the
/// per-frame systems.
///
/// The spawner counts as stalled when it has gone stallFactor spawn
/// intervals without a spawn, the population is under the cap, and the
/// population has not grown since the previous check. Recovery regenerates
/// the spawn points and forces the spawn timer so the next tick spawns.
class SpawnMonitor {
public:
    SpawnMonitor(EnemySpawner& spawner, const ActiveEnemySet& activeSet, const EnemyConfig& config,
                 const GameState& gameState, const MonitorSettings& settings);

    /// Schedule check() on the queue every watchdog interval
    void start(TimerQueue& timers);
    void stop(TimerQueue& timers);

    /// Run one watchdog check. @return true if recovery was forced
    bool check();

    size_t recoveries() const { return m_recoveries; }
    size_t checks() const { return m_checks; }
    bool isRunning() const { return m_timerId != InvalidTimerId; }

private:
    EnemySpawner& m_spawner;
    const ActiveEnemySet& m_activeSet;
    const EnemyConfig& m_config;
    const GameState& m_gameState;
    MonitorSettings m_settings;

    TimerId m_timerId = InvalidTimerId;
    size_t m_lastCount = 0;
    size_t m_recoveries = 0;
    size_t m_checks = 0;
};

} // namespace spectral
