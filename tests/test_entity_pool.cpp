#include <gtest/gtest.h>
#include "gameplay/EntityPool.hpp"
#include "gameplay/ActiveEnemySet.hpp"
#include "engine/Log.hpp"

#include <unordered_set>

using namespace spectral;

class EntityPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        Log::init("", "off");
        settings.maxPoolSize = 20;
        settings.initialSize = 10;
    }

    /// Every pooled entity holds Role::Pooled, no active entry does, and the
    /// two collections share nothing
    void expectRolesExclusive(EntityPool& pool, const ActiveEnemySet& active) {
        for (Entity e : pool.inactive()) {
            EXPECT_TRUE(world.isAlive(e));
            EXPECT_EQ(world.roleOf(e), Role::Pooled);
            EXPECT_FALSE(active.contains(e));
        }
        for (Entity e : active) {
            EXPECT_NE(world.roleOf(e), Role::Pooled);
        }
    }

    World world;
    PoolSettings settings;
};

// =============================================================================
// Preallocation / acquire
// =============================================================================

TEST_F(EntityPoolTest, PreallocateCreatesPooledHiddenEntities) {
    EntityPool pool(world, settings);
    EXPECT_EQ(pool.preallocate(10), 10u);
    EXPECT_EQ(pool.size(), 10u);

    for (Entity e : pool.inactive()) {
        EXPECT_EQ(world.roleOf(e), Role::Pooled);
        EXPECT_FALSE(world.registry().get<RenderMesh>(e).visible);
        EXPECT_FALSE(world.registry().get<EnemyAI>(e).enabled);
        EXPECT_TRUE(world.registry().get<Health>(e).isDestroyed());
    }
}

TEST_F(EntityPoolTest, PreallocateIsBoundedByCap) {
    settings.maxPoolSize = 4;
    EntityPool pool(world, settings);
    EXPECT_EQ(pool.preallocate(10), 4u);
    EXPECT_EQ(pool.size(), 4u);
}

TEST_F(EntityPoolTest, TenPreallocatedThenEleventhIsCreated) {
    EntityPool pool(world, settings);
    pool.preallocate(10);

    std::unordered_set<Entity> handed;
    for (int i = 0; i < 10; ++i) {
        handed.insert(pool.acquire());
    }
    EXPECT_EQ(handed.size(), 10u);
    EXPECT_EQ(pool.stats().reused, 10u);
    EXPECT_EQ(pool.stats().created, 0u);
    EXPECT_EQ(pool.size(), 0u);

    Entity eleventh = pool.acquire();
    EXPECT_TRUE(world.isAlive(eleventh));
    EXPECT_EQ(handed.count(eleventh), 0u);
    EXPECT_EQ(pool.stats().created, 1u);
}

TEST_F(EntityPoolTest, AcquireClearsPooledState) {
    EntityPool pool(world, settings);
    pool.preallocate(1);
    Entity e = pool.acquire();

    EXPECT_EQ(world.roleOf(e), Role::None);
    auto& registry = world.registry();
    EXPECT_TRUE(registry.get<EnemyAI>(e).enabled);
    EXPECT_FLOAT_EQ(registry.get<EnemyAI>(e).timeAlive, 0.0f);
    EXPECT_FALSE(registry.has<Frozen>(e));
    EXPECT_TRUE(registry.hasAll<Transform, Rigidbody, Health, RenderMesh, VariantState>(e));
}

TEST_F(EntityPoolTest, AcquireSkipsStaleHandles) {
    EntityPool pool(world, settings);
    pool.preallocate(2);
    Entity stale = pool.inactive().back();
    world.destroyEntity(stale);

    Entity e = pool.acquire();
    EXPECT_NE(e, stale);
    EXPECT_TRUE(world.isAlive(e));
}

// =============================================================================
// Release
// =============================================================================

TEST_F(EntityPoolTest, ReleaseReturnsEntityAndDisposesTrail) {
    EntityPool pool(world, settings);
    Entity e = pool.acquire();
    world.setRole(e, Role::ActiveEnemy);
    uint32_t trail = world.scene().createResource("trail");
    world.registry().add<TrailEffect>(e).resourceId = trail;
    world.registry().get<Rigidbody>(e).linearVelocity = {100.0f, 0.0f, 0.0f};

    pool.release(e);

    EXPECT_TRUE(pool.contains(e));
    EXPECT_EQ(world.roleOf(e), Role::Pooled);
    EXPECT_FALSE(world.scene().isResourceLive(trail));
    EXPECT_FALSE(world.registry().has<TrailEffect>(e));
    EXPECT_FLOAT_EQ(world.registry().get<Rigidbody>(e).linearVelocity.x, 0.0f);
    EXPECT_EQ(pool.stats().released, 1u);
}

TEST_F(EntityPoolTest, ReleaseAtCapacityDestroys) {
    settings.maxPoolSize = 2;
    EntityPool pool(world, settings);

    Entity a = pool.acquire();
    Entity b = pool.acquire();
    Entity c = pool.acquire();
    pool.release(a);
    pool.release(b);
    pool.release(c);

    EXPECT_EQ(pool.size(), 2u);
    EXPECT_FALSE(world.isAlive(c));
    EXPECT_EQ(pool.stats().destroyed, 1u);
}

TEST_F(EntityPoolTest, PoolNeverExceedsCap) {
    settings.maxPoolSize = 5;
    EntityPool pool(world, settings);
    std::vector<Entity> acquired;
    for (int i = 0; i < 12; ++i) acquired.push_back(pool.acquire());
    for (Entity e : acquired) {
        pool.release(e);
        EXPECT_LE(pool.size(), pool.maxSize());
    }
}

TEST_F(EntityPoolTest, DoubleReleaseIsNoOp) {
    EntityPool pool(world, settings);
    Entity e = pool.acquire();
    pool.release(e);
    pool.release(e);
    EXPECT_EQ(pool.size(), 1u);
    EXPECT_EQ(pool.stats().released, 1u);
}

TEST_F(EntityPoolTest, ReleaseOfDeadEntityIsIgnored) {
    EntityPool pool(world, settings);
    Entity e = pool.acquire();
    world.destroyEntity(e);
    EXPECT_NO_THROW(pool.release(e));
    EXPECT_EQ(pool.size(), 0u);
}

// =============================================================================
// Diagnostics
// =============================================================================

TEST_F(EntityPoolTest, DiagnosticsOnHealthyStateFixNothing) {
    EntityPool pool(world, settings);
    ActiveEnemySet active;
    pool.preallocate(5);
    Entity e = pool.acquire();
    world.setRole(e, Role::ActiveEnemy);
    active.insert(e);

    EXPECT_EQ(pool.runDiagnostics(active), 0);
    expectRolesExclusive(pool, active);
}

TEST_F(EntityPoolTest, DiagnosticsRemoveDuplicatesAndStaleEntries) {
    EntityPool pool(world, settings);
    ActiveEnemySet active;
    pool.preallocate(3);
    Entity dup = pool.inactive().front();
    pool.inactive().push_back(dup);
    Entity stale = pool.inactive()[1];
    world.destroyEntity(stale);

    EXPECT_EQ(pool.runDiagnostics(active), 2);
    EXPECT_EQ(pool.size(), 2u);
    expectRolesExclusive(pool, active);
}

TEST_F(EntityPoolTest, DiagnosticsResolveOverlapByRole) {
    EntityPool pool(world, settings);
    ActiveEnemySet active;
    pool.preallocate(2);

    // Active enemy that also sits in the pool: stays active
    Entity enemy = pool.acquire();
    world.setRole(enemy, Role::ActiveEnemy);
    active.insert(enemy);
    pool.inactive().push_back(enemy);

    // Pooled entity that also sits in the active set: stays pooled
    Entity pooled = pool.inactive().front();
    active.insert(pooled);

    EXPECT_GT(pool.runDiagnostics(active), 0);
    EXPECT_TRUE(active.contains(enemy));
    EXPECT_FALSE(pool.contains(enemy));
    EXPECT_TRUE(pool.contains(pooled));
    EXPECT_FALSE(active.contains(pooled));
    expectRolesExclusive(pool, active);
}

TEST_F(EntityPoolTest, DiagnosticsRestashWrongRoleInPool) {
    EntityPool pool(world, settings);
    ActiveEnemySet active;
    pool.preallocate(1);
    Entity e = pool.inactive().front();
    world.setRole(e, Role::None);
    world.registry().get<RenderMesh>(e).visible = true;

    EXPECT_EQ(pool.runDiagnostics(active), 1);
    EXPECT_EQ(world.roleOf(e), Role::Pooled);
    EXPECT_FALSE(world.registry().get<RenderMesh>(e).visible);
}

TEST_F(EntityPoolTest, DiagnosticsMovePooledRoleOutOfActiveSet) {
    EntityPool pool(world, settings);
    ActiveEnemySet active;
    Entity e = pool.acquire();
    world.setRole(e, Role::Pooled);
    active.insert(e);

    EXPECT_EQ(pool.runDiagnostics(active), 1);
    EXPECT_FALSE(active.contains(e));
    EXPECT_TRUE(pool.contains(e));
    expectRolesExclusive(pool, active);
}

TEST_F(EntityPoolTest, DiagnosticsAreIdempotent) {
    EntityPool pool(world, settings);
    ActiveEnemySet active;
    pool.preallocate(4);
    Entity enemy = pool.acquire();
    world.setRole(enemy, Role::ActiveEnemy);
    active.insert(enemy);
    pool.inactive().push_back(enemy);
    pool.inactive().push_back(pool.inactive().front());
    active.insert(pool.inactive()[1]);

    EXPECT_GT(pool.runDiagnostics(active), 0);
    EXPECT_EQ(pool.runDiagnostics(active), 0);
    expectRolesExclusive(pool, active);
}

TEST_F(EntityPoolTest, ClearDestroysPooledEntities) {
    EntityPool pool(world, settings);
    pool.preallocate(3);
    std::vector<Entity> pooled = pool.inactive();
    pool.clear();
    EXPECT_EQ(pool.size(), 0u);
    for (Entity e : pooled) EXPECT_FALSE(world.isAlive(e));
}

// =============================================================================
// ActiveEnemySet
// =============================================================================

TEST(ActiveEnemySetTest, KeepsInsertionOrder) {
    World world;
    Entity a = world.createEntity(Role::ActiveEnemy);
    Entity b = world.createEntity(Role::ActiveEnemy);
    Entity c = world.createEntity(Role::ActiveEnemy);

    ActiveEnemySet set;
    EXPECT_TRUE(set.insert(a));
    EXPECT_TRUE(set.insert(b));
    EXPECT_TRUE(set.insert(c));
    EXPECT_FALSE(set.insert(b));
    EXPECT_EQ(set.oldest(), a);

    EXPECT_TRUE(set.erase(a));
    EXPECT_FALSE(set.erase(a));
    EXPECT_EQ(set.oldest(), b);
    EXPECT_EQ(set.size(), 2u);
}
