#include "gameplay/HitEffectPool.hpp"
#include "engine/Log.hpp"

#include <algorithm>

namespace spectral {

HitEffectPool::HitEffectPool(World& world, const CombatSettings& settings)
    : m_world(world)
    , m_capacity(static_cast<size_t>(std::max(0, settings.hitEffectPoolSize)))
    , m_duration(std::max(0.01f, settings.hitEffectDuration))
    , m_geometry(MeshGeometry::makeOctahedron(1.0f)) {
}

Entity HitEffectPool::spawn(const Vec3& position, uint32_t color, float size) {
    auto& registry = m_world.registry();

    Entity entity = NullEntity;
    while (!m_free.empty() && entity == NullEntity) {
        Entity candidate = m_free.back();
        m_free.pop_back();
        if (m_world.isAlive(candidate)) {
            entity = candidate;
        }
    }

    if (entity == NullEntity) {
        entity = m_world.createEntity(Role::Effect);
        registry.add<Transform>(entity);
        auto& mesh = registry.add<RenderMesh>(entity);
        mesh.geometry = m_geometry;
        registry.add<HitEffect>(entity);
    }

    auto& transform = registry.get<Transform>(entity);
    transform.position = position;
    transform.scale = {size, size, size};

    auto& mesh = registry.get<RenderMesh>(entity);
    mesh.position = position;
    mesh.scale = transform.scale;
    mesh.color = color;
    mesh.opacity = 1.0f;
    mesh.visible = true;
    if (!mesh.attached) {
        m_world.scene().attach(entity);
        mesh.attached = true;
    }

    auto& effect = registry.get<HitEffect>(entity);
    effect.age = 0.0f;
    effect.duration = m_duration;
    effect.size = size;
    effect.active = true;

    m_active.push_back(entity);
    return entity;
}

void HitEffectPool::update(float dt) {
    auto& registry = m_world.registry();
    std::vector<Entity> finished;

    for (Entity entity : m_active) {
        auto* effect = registry.tryGet<HitEffect>(entity);
        auto* mesh = registry.tryGet<RenderMesh>(entity);
        if (!effect || !mesh) {
            finished.push_back(entity);
            continue;
        }

        effect->age += dt;
        float t = std::min(1.0f, effect->age / effect->duration);
        float scale = effect->size * (1.0f + 3.0f * t);
        mesh->scale = {scale, scale, scale};
        mesh->opacity = 1.0f - t;

        if (effect->age >= effect->duration) {
            finished.push_back(entity);
        }
    }

    for (Entity entity : finished) {
        m_active.erase(std::remove(m_active.begin(), m_active.end(), entity), m_active.end());
        if (!m_world.isAlive(entity)) continue;

        if (m_free.size() < m_capacity) {
            if (auto* effect = registry.tryGet<HitEffect>(entity)) effect->active = false;
            if (auto* mesh = registry.tryGet<RenderMesh>(entity)) mesh->visible = false;
            m_free.push_back(entity);
        } else {
            m_world.destroyEntity(entity);
        }
    }
}

void HitEffectPool::clear() {
    for (Entity entity : m_active) m_world.destroyEntity(entity);
    for (Entity entity : m_free) m_world.destroyEntity(entity);
    m_active.clear();
    m_free.clear();
}

} // namespace spectral
