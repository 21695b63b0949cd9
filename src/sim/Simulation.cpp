#include "sim/Simulation.hpp"
#include "engine/Log.hpp"
#include "events/Events.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace spectral {

namespace {

constexpr float MAX_FRAME_DELTA = 0.25f;
constexpr float PROJECTILE_LIFETIME = 2.0f;
constexpr float PLAYER_HULL = 200.0f;
constexpr float PLAYER_SHIELD = 100.0f;

} // anonymous namespace

// ============================================================================
// AutoGunnerSystem
// ============================================================================

AutoGunnerSystem::AutoGunnerSystem(World& world, MessageBus& bus, const SimulationSettings& settings,
                                   const CombatSettings& combat)
    : System("AutoGunnerSystem", 0)
    , m_world(world)
    , m_bus(bus)
    , m_fireInterval(settings.fireInterval)
    , m_projectileSpeed(settings.projectileSpeed)
    , m_damage(combat.defaultDamage) {}

void AutoGunnerSystem::update(float dt) {
    if (m_fireInterval <= 0.0f) return;

    m_cooldown -= dt;
    if (m_cooldown > 0.0f) return;

    Entity player = m_world.player();
    auto origin = m_world.positionOf(player);
    if (!origin) return;

    Entity nearest = NullEntity;
    float nearestDistSq = std::numeric_limits<float>::max();
    for (Entity enemy : m_world.entitiesWithRole(Role::ActiveEnemy)) {
        auto pos = m_world.positionOf(enemy);
        if (!pos) continue;
        float distSq = (*pos - *origin).lengthSquared();
        if (distSq < nearestDistSq) {
            nearestDistSq = distSq;
            nearest = enemy;
        }
    }
    if (nearest == NullEntity) return;

    Vec3 target = *m_world.positionOf(nearest);
    fire(*origin, target - *origin, Role::Projectile, player);
    m_cooldown = m_fireInterval;
}

Entity AutoGunnerSystem::fire(const Vec3& origin, const Vec3& direction, Role role, Entity source) {
    Vec3 dir = direction.normalized();
    if (dir.lengthSquared() < 1e-6f) {
        LOG_WARN("AutoGunner: refusing to fire along a zero direction");
        return NullEntity;
    }

    Entity projectile = m_world.createEntity(role);
    auto& registry = m_world.registry();
    registry.add<Transform>(projectile, Transform(origin));
    registry.add<Rigidbody>(projectile, Rigidbody(dir * m_projectileSpeed));
    registry.add<ProjectileData>(projectile, ProjectileData(m_damage, source));
    registry.add<Lifetime>(projectile, Lifetime(PROJECTILE_LIFETIME));

    EventData data;
    data.setEntity("projectile", projectile);
    data.setEntity("source", source);
    data.setVec3("", origin);
    m_bus.publish(role == Role::EnemyProjectile ? events::TurretFire : events::WeaponFired, data);

    ++m_shotsFired;
    return projectile;
}

// ============================================================================
// Simulation
// ============================================================================

Simulation::Simulation(const SpectralSettings& settings, std::unique_ptr<IAssetLoader> assets)
    : m_settings(settings)
    , m_assets(assets ? std::move(assets) : std::make_unique<NullAssetLoader>())
    , m_difficulty(m_bus)
    , m_store(settings.horde.leaderboardPath)
    , m_leaderboard(m_store, static_cast<size_t>(std::max(1, settings.horde.leaderboardSize)))
    , m_horde(m_bus, m_gameState, m_leaderboard) {
    if (!m_store.load()) {
        LOG_WARN("Simulation: could not load leaderboard from '{}', starting empty",
                 settings.horde.leaderboardPath);
    }

    m_player = createPlayer();

    m_gunner = m_scheduler.addSystem<AutoGunnerSystem>(SystemPhase::PreUpdate, m_world, m_bus,
                                                       settings.simulation, settings.combat);
    m_scheduler.addSystem<MovementSystem>(SystemPhase::Update, m_world);
    m_enemies = m_scheduler.addSystem<EnemySystem>(SystemPhase::Update, m_world, m_bus, m_gameState,
                                                   m_timers, *m_assets, settings, &m_horde,
                                                   &m_difficulty);
    m_combat = m_scheduler.addSystem<CombatCollisionSystem>(SystemPhase::PostUpdate, m_world, m_bus,
                                                            settings.combat);
    m_scheduler.addSystem<LifetimeSystem>(SystemPhase::PostUpdate, m_world);

    if (settings.simulation.seed != 0) {
        m_enemies->pool().seed(settings.simulation.seed);
        m_enemies->spawner().seed(settings.simulation.seed + 1);
    }

    m_destroyedSub = m_bus.subscribe(events::EntityDestroyed, [this](const EventData& data) {
        if (data.getEntity("entity") != m_player || m_gameState.gameOver) return false;
        LOG_WARN("Simulation: player ship destroyed");
        m_gameState.gameOver = true;
        if (m_horde.isActive()) {
            m_lastRun = m_horde.endRun();
        }
        return false;
    });

    LOG_INFO("Simulation: ready ({} systems, timestep {:.4f}s)", m_scheduler.getTotalSystemCount(),
             settings.simulation.fixedTimestep);
}

Simulation::~Simulation() {
    m_bus.unsubscribe(m_destroyedSub);
    m_scheduler.shutdown();
}

Entity Simulation::createPlayer() {
    Entity player = m_world.createEntity(Role::Player);
    auto& registry = m_world.registry();
    registry.add<Transform>(player);
    registry.add<Rigidbody>(player);
    registry.add<Health>(player, Health(PLAYER_HULL, PLAYER_SHIELD));
    auto& mesh = registry.add<RenderMesh>(player);
    mesh.geometry = MeshGeometry::makeBox(Vec3(40.0f, 20.0f, 60.0f));
    mesh.color = 0xffffff;
    m_world.setPlayer(player);
    m_gameState.shipPosition = Vec3{};
    return player;
}

int Simulation::frame(float realDt) {
    const float timestep = m_settings.simulation.fixedTimestep;
    m_accumulator += std::clamp(realDt, 0.0f, MAX_FRAME_DELTA);

    int steps = 0;
    while (m_accumulator >= timestep && steps < m_settings.simulation.maxStepsPerFrame) {
        step();
        m_accumulator -= timestep;
        ++steps;
    }
    // Drop backlog beyond the per-frame cap
    if (m_accumulator >= timestep) {
        LOG_DEBUG("Simulation: dropping {:.3f}s of backlog", m_accumulator - timestep);
        m_accumulator = std::fmod(m_accumulator, timestep);
    }
    return steps;
}

void Simulation::step() {
    const float dt = m_settings.simulation.fixedTimestep;

    m_timers.advance(dt);
    // Horde mode runs its own curve; the timed levels hold while it or docking is active
    m_difficulty.setPaused(m_gameState.docked || m_horde.isActive());
    m_difficulty.update(dt);
    m_gameState.shipPosition = m_world.positionOf(m_player);
    m_scheduler.update(dt);

    m_simulatedTime += dt;
    ++m_steps;
}

SimulationReport Simulation::run(float seconds) {
    const float end = m_simulatedTime + seconds;
    while (m_simulatedTime < end && !m_gameState.gameOver) {
        step();
    }
    if (m_horde.isActive()) {
        endHorde();
    }
    return report();
}

void Simulation::activateHorde() {
    m_horde.activate();
}

HordeRunSummary Simulation::endHorde() {
    if (!m_horde.isActive()) {
        LOG_WARN("Simulation::endHorde: horde mode is not active");
        return m_lastRun;
    }
    m_lastRun = m_horde.endRun();
    return m_lastRun;
}

void Simulation::dock() {
    m_difficulty.setPaused(true);
    m_bus.publish(events::PlayerDocked, EventData{});
}

void Simulation::undock() {
    EventData data;
    data.setBool("forced", false);
    m_bus.publish(events::PlayerUndocked, data);
    m_difficulty.setPaused(false);
}

SimulationReport Simulation::report() const {
    SimulationReport report;
    report.simulatedSeconds = m_simulatedTime;
    report.steps = m_steps;
    report.enemiesSpawned = m_enemies->spawner().spawnCount();
    report.enemiesKilled = m_enemies->killCount();
    report.activeEnemies = m_enemies->activeCount();
    report.shotsFired = m_gunner->shotsFired();
    report.combat = m_combat->stats();
    report.pool = m_enemies->pool().stats();
    report.difficultyLevel = m_difficulty.getCurrentLevel();
    report.hordeMode = m_horde.isActive() || m_lastRun.wave > 0;
    report.horde = m_lastRun;
    return report;
}

} // namespace spectral
