#include <gtest/gtest.h>
#include "gameplay/SpawnMonitor.hpp"
#include "engine/Log.hpp"

using namespace spectral;

class SpawnMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Log::init("", "off");
        config.spawnInterval = 1.0f;
        config.maxEnemies = 10;
    }

    /// Advance the spawner with every spawn failing, so it sits idle
    void stall(EnemySpawner& spawner, float seconds) {
        spawner.update(seconds, active, config.maxEnemies, [](const Vec3&) { return NullEntity; });
    }

    World world;
    MessageBus bus;
    GameState gameState;
    NullAssetLoader assets;
    SpawnerSettings spawnerSettings;
    MonitorSettings monitorSettings;
    EnemyConfig config;
    ActiveEnemySet active;
    TimerQueue timers;
};

// =============================================================================
// Stall detection
// =============================================================================

TEST_F(SpawnMonitorTest, HealthySpawnerIsLeftAlone) {
    EnemySpawner spawner(world, bus, gameState, assets, spawnerSettings, config);
    SpawnMonitor monitor(spawner, active, config, gameState, monitorSettings);
    stall(spawner, 2.0f);

    EXPECT_FALSE(monitor.check());
    EXPECT_EQ(monitor.recoveries(), 0u);
    EXPECT_EQ(monitor.checks(), 1u);
}

TEST_F(SpawnMonitorTest, StallForcesRecovery) {
    EnemySpawner spawner(world, bus, gameState, assets, spawnerSettings, config);
    SpawnMonitor monitor(spawner, active, config, gameState, monitorSettings);
    stall(spawner, 4.0f);
    spawner.resetSpawnPoints();

    EXPECT_TRUE(monitor.check());
    EXPECT_EQ(monitor.recoveries(), 1u);
    EXPECT_FALSE(spawner.spawnPoints().empty());
    EXPECT_FLOAT_EQ(spawner.timer(), 1.0f);
}

TEST_F(SpawnMonitorTest, RecoveredSpawnerSpawnsNextTick) {
    EnemySpawner spawner(world, bus, gameState, assets, spawnerSettings, config);
    SpawnMonitor monitor(spawner, active, config, gameState, monitorSettings);
    stall(spawner, 4.0f);
    spawner.forceTimer(0.0f);
    ASSERT_TRUE(monitor.check());

    int calls = 0;
    bool spawned = spawner.update(0.01f, active, config.maxEnemies, [this, &calls](const Vec3&) {
        ++calls;
        return world.createEntity(Role::ActiveEnemy);
    });
    EXPECT_TRUE(spawned);
    EXPECT_EQ(calls, 1);
}

TEST_F(SpawnMonitorTest, GrowingPopulationIsNotStalled) {
    EnemySpawner spawner(world, bus, gameState, assets, spawnerSettings, config);
    SpawnMonitor monitor(spawner, active, config, gameState, monitorSettings);
    stall(spawner, 4.0f);
    active.insert(world.createEntity(Role::ActiveEnemy));

    EXPECT_FALSE(monitor.check());
    // Same population on the next check counts as stalled
    EXPECT_TRUE(monitor.check());
}

TEST_F(SpawnMonitorTest, FullPopulationIsNotStalled) {
    config.maxEnemies = 1;
    EnemySpawner spawner(world, bus, gameState, assets, spawnerSettings, config);
    SpawnMonitor monitor(spawner, active, config, gameState, monitorSettings);
    active.insert(world.createEntity(Role::ActiveEnemy));
    monitor.check();
    stall(spawner, 4.0f);

    EXPECT_FALSE(monitor.check());
    EXPECT_EQ(monitor.recoveries(), 0u);
}

TEST_F(SpawnMonitorTest, DockedIsNotStalled) {
    EnemySpawner spawner(world, bus, gameState, assets, spawnerSettings, config);
    SpawnMonitor monitor(spawner, active, config, gameState, monitorSettings);
    stall(spawner, 4.0f);
    gameState.docked = true;
    EXPECT_FALSE(monitor.check());
}

TEST_F(SpawnMonitorTest, PausedIsNotStalled) {
    EnemySpawner spawner(world, bus, gameState, assets, spawnerSettings, config);
    SpawnMonitor monitor(spawner, active, config, gameState, monitorSettings);
    stall(spawner, 4.0f);
    spawner.setPaused(true);
    EXPECT_FALSE(monitor.check());
}

// =============================================================================
// Scheduling
// =============================================================================

TEST_F(SpawnMonitorTest, RunsFromTimerQueue) {
    EnemySpawner spawner(world, bus, gameState, assets, spawnerSettings, config);
    SpawnMonitor monitor(spawner, active, config, gameState, monitorSettings);
    monitor.start(timers);
    EXPECT_TRUE(monitor.isRunning());

    timers.advance(9.0f);
    EXPECT_EQ(monitor.checks(), 0u);
    timers.advance(1.0f);
    EXPECT_EQ(monitor.checks(), 1u);
    timers.advance(10.0f);
    EXPECT_EQ(monitor.checks(), 2u);
}

TEST_F(SpawnMonitorTest, StartTwiceSchedulesOnce) {
    EnemySpawner spawner(world, bus, gameState, assets, spawnerSettings, config);
    SpawnMonitor monitor(spawner, active, config, gameState, monitorSettings);
    monitor.start(timers);
    monitor.start(timers);
    EXPECT_EQ(timers.activeCount(), 1u);
}

TEST_F(SpawnMonitorTest, StopCancelsTimer) {
    EnemySpawner spawner(world, bus, gameState, assets, spawnerSettings, config);
    SpawnMonitor monitor(spawner, active, config, gameState, monitorSettings);
    monitor.start(timers);
    monitor.stop(timers);
    EXPECT_FALSE(monitor.isRunning());

    timers.advance(30.0f);
    EXPECT_EQ(monitor.checks(), 0u);
    EXPECT_EQ(timers.activeCount(), 0u);
}
