#pragma once

#include "ecs/World.hpp"
#include "engine/Settings.hpp"
#include "gameplay/ActiveEnemySet.hpp"

#include <random>
#include <vector>

namespace spectral {

/// Lifetime counters for the enemy pool
struct PoolStats {
    size_t created = 0;    ///< Entities constructed by the pool
    size_t reused = 0;     ///< acquire() calls served from the pool
    size_t released = 0;   ///< release() calls that returned an entity to the pool
    size_t destroyed = 0;  ///< release() calls that destroyed an entity at capacity
};

/// Recycles enemy entities. An entity in the inactive list holds Role::Pooled
/// and nothing else may claim it until acquire() hands it out.
class EntityPool {
public:
    EntityPool(World& world, const PoolSettings& settings);

    EntityPool(const EntityPool&) = delete;
    EntityPool& operator=(const EntityPool&) = delete;

    /// Create up to n hidden, Role::Pooled entities (bounded by the pool cap).
    /// @return number of entities created
    size_t preallocate(size_t n);

    /// Hand out a recycled entity with Role::None, cleared timers and a fresh
    /// spiral phase; constructs a new one if the pool is empty. Never fails.
    Entity acquire();

    /// Return an entity to the pool: disposes its trail, stops it, marks its
    /// health destroyed, hides its mesh and sets Role::Pooled. At capacity the
    /// entity is destroyed instead. No-op for an entity already pooled.
    void release(Entity entity);

    /// Scan for duplicate or stale pool entries and pool/active-set overlap,
    /// repair each in place and return the number of fixes. Never throws.
    int runDiagnostics(ActiveEnemySet& activeSet);

    /// Destroy every pooled entity
    void clear();

    size_t size() const { return m_inactive.size(); }
    size_t maxSize() const { return m_maxSize; }
    bool contains(Entity entity) const;
    const PoolStats& stats() const { return m_stats; }

    /// The inactive list itself. Shared with sibling components that repair
    /// or inspect it directly; runDiagnostics() restores its invariants.
    std::vector<Entity>& inactive() { return m_inactive; }

    void seed(unsigned int value) { m_rng.seed(value); }

private:
    /// Entity with every component an enemy needs, hidden and disabled
    Entity createBareEnemy();

    /// Put the entity into the pooled state without touching the list
    void stash(Entity entity);

    World& m_world;
    size_t m_maxSize;
    std::vector<Entity> m_inactive;
    PoolStats m_stats;
    std::mt19937 m_rng{std::random_device{}()};
};

} // namespace spectral
