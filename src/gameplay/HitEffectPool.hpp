#pragma once

#include "ecs/World.hpp"
#include "engine/Settings.hpp"

#include <memory>
#include <vector>

namespace spectral {

/// Recycled impact markers: each grows and fades over its duration, then
/// returns to the free list.
class HitEffectPool {
public:
    HitEffectPool(World& world, const CombatSettings& settings);

    /// Show an effect at the position. Reuses a free marker when possible.
    Entity spawn(const Vec3& position, uint32_t color, float size);

    /// Grow and fade live markers; recycle the finished ones
    void update(float dt);

    size_t activeCount() const { return m_active.size(); }
    size_t freeCount() const { return m_free.size(); }

    /// Destroy every marker, live or free
    void clear();

private:
    World& m_world;
    size_t m_capacity;
    float m_duration;
    std::shared_ptr<const MeshGeometry> m_geometry;
    std::vector<Entity> m_active;
    std::vector<Entity> m_free;
};

} // namespace spectral
