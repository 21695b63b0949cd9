#include "gameplay/EnemySystem.hpp"
#include "engine/Log.hpp"
#include "events/Events.hpp"

#include <algorithm>

namespace spectral {

EnemySystem::EnemySystem(World& world, MessageBus& bus, GameState& gameState, TimerQueue& timers,
                         IAssetLoader& assets, const SpectralSettings& settings,
                         HordeMode* horde, const IDifficultySource* difficulty)
    : System("EnemySystem", 10)
    , m_world(world)
    , m_bus(bus)
    , m_gameState(gameState)
    , m_timers(timers)
    , m_settings(settings)
    , m_pool(world, settings.pool)
    , m_spawner(world, bus, gameState, assets, settings.spawner, m_config)
    , m_lifecycle(world, bus)
    , m_scaling(m_config)
    , m_monitor(m_spawner, m_active, m_config, gameState, settings.monitor)
    , m_horde(horde) {
    m_scaling.setSource(difficulty);

    const size_t warmup = static_cast<size_t>(std::max(0, settings.pool.initialSize));
    m_warmupTimer = m_timers.after(settings.pool.warmupDelay, [this, warmup]() {
        m_warmupTimer = InvalidTimerId;
        m_pool.preallocate(warmup);
    });
    m_diagnosticsTimer = m_timers.every(settings.monitor.diagnosticsInterval, [this]() {
        runDiagnosticsPass();
    });
    m_monitor.start(m_timers);

    m_subscriptions.push_back(m_bus.subscribe(events::PlayerDocked, [this](const EventData&) {
        m_gameState.docked = true;
        freezeAllEnemies();
        return false;
    }));
    m_subscriptions.push_back(m_bus.subscribe(events::PlayerUndocked, [this](const EventData& data) {
        m_gameState.docked = false;
        if (data.getBool("forced")) {
            LOG_INFO("EnemySystem: forced undock ({})", data.getString("reason"));
        }
        unfreezeAllEnemies();
        return false;
    }));
    m_subscriptions.push_back(m_bus.subscribe(events::EntityDestroyed, [this](const EventData& data) {
        onEntityDestroyed(data);
        return false;
    }));

    LOG_INFO("EnemySystem: initialised (pool cap {}, warm-up {}, {} spawn points)",
             settings.pool.maxPoolSize, warmup, settings.spawner.spawnPointCount);
}

EnemySystem::~EnemySystem() {
    shutdown();
}

void EnemySystem::shutdown() {
    if (m_shutdown) return;
    m_shutdown = true;

    for (SubscriptionId id : m_subscriptions) {
        m_bus.unsubscribe(id);
    }
    m_subscriptions.clear();

    m_monitor.stop(m_timers);
    if (m_warmupTimer != InvalidTimerId) m_timers.cancel(m_warmupTimer);
    if (m_diagnosticsTimer != InvalidTimerId) m_timers.cancel(m_diagnosticsTimer);
    m_warmupTimer = m_diagnosticsTimer = InvalidTimerId;
}

void EnemySystem::update(float dt) {
    const bool hordeActive = m_horde && m_horde->isActive();
    if (hordeActive) {
        m_horde->update(dt);
    }
    m_scaling.update(hordeActive, hordeActive ? m_horde->survivalTime() : 0.0f);

    if (m_gameState.docked) {
        if (!m_frozen) freezeAllEnemies();
        return;
    }
    if (m_frozen) {
        unfreezeAllEnemies();
    }

    m_lifecycle.enforceEnemyLimit(m_active, m_config.maxEnemies,
                                  [this](Entity entity) { releaseEnemy(entity); });

    m_spawner.update(dt, m_active, m_config.maxEnemies, [this](const Vec3& position) {
        return m_spawner.spawnSpectralDrone(position, m_pool, m_active, m_config.maxEnemies);
    });

    m_lifecycle.setPursuitTarget(m_spawner.resolvePlayerPosition());
    for (Entity entity : m_active.snapshot()) {
        m_lifecycle.processEntityUpdate(entity, dt);
    }
}

int EnemySystem::freezeAllEnemies() {
    m_frozen = true;
    m_spawner.setPaused(true);
    return m_lifecycle.freezeAllEnemies(m_active);
}

int EnemySystem::unfreezeAllEnemies() {
    m_frozen = false;
    m_spawner.setPaused(false);
    return m_lifecycle.unfreezeAllEnemies(m_active);
}

int EnemySystem::runDiagnosticsPass() {
    int poolFixes = m_pool.runDiagnostics(m_active);
    int referenceFixes = m_lifecycle.validateEnemyReferences(m_active);

    const auto& stats = m_pool.stats();
    if (poolFixes + referenceFixes > 0) {
        DIAG_LOG_INFO("Diagnostics: {} pool fixes, {} reference fixes; active {}/{}, pool {}",
                      poolFixes, referenceFixes, m_active.size(), m_config.maxEnemies, m_pool.size());
    } else {
        DIAG_LOG_DEBUG("Diagnostics: active {}/{}, pool {} (created {}, reused {}, released {}, destroyed {})",
                       m_active.size(), m_config.maxEnemies, m_pool.size(),
                       stats.created, stats.reused, stats.released, stats.destroyed);
    }
    return poolFixes + referenceFixes;
}

Entity EnemySystem::spawnEnemyAt(const Vec3& position) {
    return m_spawner.spawnSpectralDrone(position, m_pool, m_active, m_config.maxEnemies);
}

void EnemySystem::releaseEnemy(Entity entity) {
    m_active.erase(entity);
    m_pool.release(entity);
}

void EnemySystem::onEntityDestroyed(const EventData& data) {
    Entity entity = data.getEntity("entity");
    if (!m_active.contains(entity)) return;

    releaseEnemy(entity);
    ++m_kills;

    if (m_horde && m_horde->isActive()) {
        m_horde->onEnemyDestroyed();
    }

    const int refreshEvery = m_settings.spawner.killsPerPointRefresh;
    if (refreshEvery > 0 && m_kills % static_cast<size_t>(refreshEvery) == 0) {
        m_spawner.resetSpawnPoints();
    }

    // Bring the next spawn forward once the field is clear
    if (m_active.empty()) {
        m_spawner.forceTimer(std::max(m_spawner.timer(), 0.8f * m_spawner.spawnInterval()));
    }
}

} // namespace spectral
