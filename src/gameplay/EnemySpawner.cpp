#include "gameplay/EnemySpawner.hpp"
#include "engine/Log.hpp"
#include "events/Events.hpp"

#include <algorithm>
#include <cmath>

namespace spectral {

namespace {

constexpr float kTwoPi = 6.2831853f;

uint32_t variantColor(VisualVariant variant) {
    switch (variant) {
        case VisualVariant::Damaged:     return 0x8899aa;
        case VisualVariant::Elite:       return 0xaaffff;
        case VisualVariant::Overcharged: return 0xff66ff;
        case VisualVariant::Standard:    break;
    }
    return 0x66ccff;
}

} // namespace

EnemySpawner::EnemySpawner(World& world, MessageBus& bus, GameState& gameState, IAssetLoader& assets,
                           const SpawnerSettings& settings, const EnemyConfig& config)
    : m_world(world)
    , m_bus(bus)
    , m_gameState(gameState)
    , m_assets(assets)
    , m_settings(settings)
    , m_config(config) {
}

std::optional<Vec3> EnemySpawner::resolvePlayerPosition() {
    for (Entity entity : m_world.entitiesWithRole(Role::Player)) {
        if (auto pos = m_world.positionOf(entity)) {
            return pos;
        }
    }

    Entity registered = m_world.player();
    if (registered != NullEntity) {
        if (auto pos = m_world.positionOf(registered)) {
            return pos;
        }
    }

    return m_gameState.shipPosition;
}

const std::vector<Vec3>& EnemySpawner::generateSpawnPoints() {
    const int count = std::max(1, m_settings.spawnPointCount);
    m_spawnPoints.clear();
    m_spawnPoints.reserve(static_cast<size_t>(count));

    std::uniform_real_distribution<float> unit(0.0f, 1.0f);
    auto playerPos = resolvePlayerPosition();

    if (playerPos) {
        // phi = acos(2u - 1) keeps the points uniform by area rather than
        // bunching them at the poles
        const float radius = m_settings.spawnRadius;
        for (int i = 0; i < count; ++i) {
            float phi = std::acos(2.0f * unit(m_rng) - 1.0f);
            float theta = kTwoPi * unit(m_rng);
            Vec3 offset{radius * std::sin(phi) * std::cos(theta),
                        radius * std::sin(phi) * std::sin(theta),
                        radius * std::cos(phi)};
            m_spawnPoints.push_back(*playerPos + offset);
        }
        m_generationCenter = playerPos;
        LOG_DEBUG("EnemySpawner: generated {} spawn points around player ({:.0f}, {:.0f}, {:.0f})",
                  count, playerPos->x, playerPos->y, playerPos->z);
    } else {
        std::uniform_real_distribution<float> jitter(-m_settings.fallbackHeightJitter,
                                                     m_settings.fallbackHeightJitter);
        const float radius = m_settings.fallbackRadius;
        for (int i = 0; i < count; ++i) {
            float angle = kTwoPi * static_cast<float>(i) / static_cast<float>(count);
            m_spawnPoints.push_back({radius * std::cos(angle), jitter(m_rng), radius * std::sin(angle)});
        }
        m_generationCenter.reset();
        LOG_WARN("EnemySpawner: no player position, using {} fallback points around the origin", count);
    }

    return m_spawnPoints;
}

Vec3 EnemySpawner::getRandomSpawnPoint() {
    if (m_spawnPoints.empty() || zoneChanged(resolvePlayerPosition())) {
        generateSpawnPoints();
    }

    std::uniform_int_distribution<size_t> pick(0, m_spawnPoints.size() - 1);
    return m_spawnPoints[pick(m_rng)];
}

Entity EnemySpawner::spawnSpectralDrone(const Vec3& position, EntityPool& pool,
                                        ActiveEnemySet& activeSet, int maxEnemies) {
    if (activeSet.size() >= static_cast<size_t>(std::max(0, maxEnemies))) {
        LOG_DEBUG("EnemySpawner: at enemy cap ({}/{}), spawn refused", activeSet.size(), maxEnemies);
        return NullEntity;
    }

    auto& registry = m_world.registry();
    Entity entity = pool.acquire();
    m_world.setRole(entity, Role::ActiveEnemy);

    const EnemySubtype subtype = selectSubtype(m_rng);
    const SubtypeProfile& profile = subtypeProfile(subtype);
    const VisualVariant variant = rollVariant(m_rng);

    std::uniform_real_distribution<float> amplitudeJitter(0.8f, 1.2f);
    std::uniform_real_distribution<float> frequencyJitter(0.8f, 1.2f);
    std::uniform_real_distribution<float> speedJitter(0.7f, 1.3f);
    std::uniform_real_distribution<float> sizeJitter(0.8f, 1.2f);
    std::uniform_real_distribution<float> yaw(0.0f, kTwoPi);

    const float sizeFactor = profile.sizeMultiplier * sizeJitter(m_rng);
    const float size = ENEMY_BASE_SIZE * sizeFactor;

    auto& transform = registry.get<Transform>(entity);
    transform.position = position;
    transform.rotation = {0.0f, yaw(m_rng), 0.0f};
    transform.scale = {size, size, size};

    const float hull = std::floor(m_config.health * profile.healthMultiplier);
    const bool shielded = variant == VisualVariant::Elite || variant == VisualVariant::Overcharged;
    registry.get<Health>(entity).reset(std::max(1.0f, hull), shielded ? std::floor(hull * 0.5f) : 0.0f);

    auto& ai = registry.get<EnemyAI>(entity);
    ai.speed = m_config.speed * profile.speedMultiplier * speedJitter(m_rng);
    ai.spiralAmplitude = m_config.spiralAmplitude * amplitudeJitter(m_rng);
    ai.spiralFrequency = m_config.spiralFrequency * frequencyJitter(m_rng);
    ai.damage = std::floor(m_config.damage * profile.damageMultiplier);
    ai.collisionRadius = profile.collisionRadius * sizeFactor / profile.sizeMultiplier;
    ai.subtype = subtype;
    ai.enabled = true;

    registry.get<Rigidbody>(entity).stop();

    auto& mesh = registry.get<RenderMesh>(entity);
    mesh.geometry = droneGeometry();
    mesh.placeholder = !m_loadedModel;
    mesh.visible = true;
    mesh.position = transform.position;
    mesh.rotation = transform.rotation;
    mesh.scale = transform.scale;
    mesh.color = variantColor(variant);
    mesh.emissiveIntensity = 1.0f;
    mesh.opacity = 1.0f;
    mesh.childAnimationTime = 0.0f;

    registry.addOrReplace<VariantState>(entity, variant);

    TrailEffect trail;
    trail.resourceId = m_world.scene().createResource("trail");
    trail.length = size * 2.5f;
    registry.addOrReplace<TrailEffect>(entity, trail);

    activeSet.insert(entity);
    ++m_spawnCount;

    EventData data;
    data.setEntity("entity", entity);
    data.setString("subtype", profile.name);
    data.setString("variant", variantName(variant));
    data.setVec3("", position);
    m_bus.publish(events::EnemySpawned, data);

    LOG_DEBUG("EnemySpawner: spawned {} {} drone {} at ({:.0f}, {:.0f}, {:.0f}) [{}/{}]",
              variantName(variant), profile.name, toIntegral(entity),
              position.x, position.y, position.z, activeSet.size(), maxEnemies);
    return entity;
}

bool EnemySpawner::update(float dt, const ActiveEnemySet& activeSet, int maxEnemies,
                          const SpawnFn& spawnFn) {
    if (m_paused) return false;

    if (m_elapsed < m_settings.initialDelay) {
        m_elapsed += dt;
        return false;
    }

    m_timer += dt;
    m_timeSinceLastSpawn += dt;

    if (m_timer < spawnInterval()) return false;
    if (activeSet.size() >= static_cast<size_t>(std::max(0, maxEnemies))) return false;
    if (!spawnFn) return false;

    Vec3 point = getRandomSpawnPoint();
    Entity spawned = spawnFn(point);
    if (spawned == NullEntity) {
        LOG_DEBUG("EnemySpawner: spawn at ({:.0f}, {:.0f}, {:.0f}) failed, regenerating spawn points",
                  point.x, point.y, point.z);
        resetSpawnPoints();
        return false;
    }

    m_timer = 0.0f;
    m_timeSinceLastSpawn = 0.0f;
    return true;
}

float EnemySpawner::spawnInterval() const {
    return std::clamp(m_config.spawnInterval, m_settings.minInterval, m_settings.maxInterval);
}

void EnemySpawner::resetSpawnPoints() {
    m_spawnPoints.clear();
    m_generationCenter.reset();
}

std::shared_ptr<const MeshGeometry> EnemySpawner::droneGeometry() {
    if (!m_modelLoadAttempted) {
        m_modelLoadAttempted = true;
        try {
            m_loadedModel = m_assets.loadMesh(m_settings.modelPath);
        } catch (const std::exception& ex) {
            LOG_WARN("EnemySpawner: loading '{}' threw: {}", m_settings.modelPath, ex.what());
            m_loadedModel.reset();
        }
        if (m_loadedModel && m_loadedModel->empty()) {
            LOG_WARN("EnemySpawner: '{}' has no triangles", m_settings.modelPath);
            m_loadedModel.reset();
        }
        if (!m_loadedModel) {
            LOG_WARN("EnemySpawner: using procedural placeholder for '{}'", m_settings.modelPath);
        }
    }

    if (m_loadedModel) return m_loadedModel;

    if (!m_placeholder) {
        m_placeholder = MeshGeometry::makePlaceholderDrone();
    }
    return m_placeholder;
}

bool EnemySpawner::zoneChanged(const std::optional<Vec3>& playerPos) const {
    if (!playerPos) return false;
    // Points sampled around the origin fallback are replaced once a player appears
    if (!m_generationCenter) return true;
    return Vec3::distance(*m_generationCenter, *playerPos) > m_settings.zoneChangeDistance;
}

} // namespace spectral
