#include <gtest/gtest.h>
#include "gameplay/EnemyLifecycle.hpp"
#include "gameplay/EntityPool.hpp"
#include "events/Events.hpp"
#include "engine/Log.hpp"

#include <vector>

using namespace spectral;

class EnemyLifecycleTest : public ::testing::Test {
protected:
    void SetUp() override {
        Log::init("", "off");
    }

    /// Live enemy with everything processEntityUpdate needs
    Entity makeEnemy(const Vec3& position = {}, VisualVariant variant = VisualVariant::Standard) {
        Entity e = world.createEntity(Role::ActiveEnemy);
        auto& registry = world.registry();
        registry.add<Transform>(e, Transform(position));
        registry.add<Rigidbody>(e);
        registry.add<Health>(e, Health(20.0f));
        registry.add<EnemyAI>(e);
        registry.add<VariantState>(e, variant);
        auto& mesh = registry.add<RenderMesh>(e);
        mesh.geometry = MeshGeometry::makePlaceholderDrone();
        active.insert(e);
        return e;
    }

    World world;
    MessageBus bus;
    ActiveEnemySet active;
};

// =============================================================================
// Reference validation
// =============================================================================

TEST_F(EnemyLifecycleTest, ValidateDropsDeadAndWrongRoleEntries) {
    EnemyLifecycle lifecycle(world, bus);
    Entity alive = makeEnemy();
    Entity dead = makeEnemy();
    Entity demoted = makeEnemy();
    world.destroyEntity(dead);
    world.setRole(demoted, Role::Pooled);

    EXPECT_EQ(lifecycle.validateEnemyReferences(active), 2);
    EXPECT_TRUE(active.contains(alive));
    EXPECT_FALSE(active.contains(dead));
    EXPECT_FALSE(active.contains(demoted));
}

TEST_F(EnemyLifecycleTest, ValidateAdoptsUntrackedEnemies) {
    EnemyLifecycle lifecycle(world, bus);
    Entity stray = world.createEntity(Role::ActiveEnemy);

    EXPECT_EQ(lifecycle.validateEnemyReferences(active), 1);
    EXPECT_TRUE(active.contains(stray));
    EXPECT_EQ(lifecycle.validateEnemyReferences(active), 0);
}

// =============================================================================
// Freeze / unfreeze
// =============================================================================

TEST_F(EnemyLifecycleTest, FreezeStopsAndUnfreezeRestoresAIFlags) {
    EnemyLifecycle lifecycle(world, bus);
    Entity hunting = makeEnemy();
    Entity idle = makeEnemy();
    auto& registry = world.registry();
    registry.get<Rigidbody>(hunting).linearVelocity = {500.0f, 0.0f, 0.0f};
    registry.get<EnemyAI>(idle).enabled = false;

    EXPECT_EQ(lifecycle.freezeAllEnemies(active), 2);
    EXPECT_TRUE(registry.has<Frozen>(hunting));
    EXPECT_FALSE(registry.get<EnemyAI>(hunting).enabled);
    EXPECT_FLOAT_EQ(registry.get<Rigidbody>(hunting).linearVelocity.x, 0.0f);

    EXPECT_EQ(lifecycle.unfreezeAllEnemies(active), 2);
    EXPECT_TRUE(registry.get<EnemyAI>(hunting).enabled);
    EXPECT_FALSE(registry.get<EnemyAI>(idle).enabled);
    EXPECT_FALSE(registry.has<Frozen>(hunting));
}

TEST_F(EnemyLifecycleTest, DoubleFreezeKeepsSavedFlag) {
    EnemyLifecycle lifecycle(world, bus);
    Entity e = makeEnemy();

    EXPECT_EQ(lifecycle.freezeAllEnemies(active), 1);
    EXPECT_EQ(lifecycle.freezeAllEnemies(active), 0);
    lifecycle.unfreezeAllEnemies(active);
    EXPECT_TRUE(world.registry().get<EnemyAI>(e).enabled);
}

TEST_F(EnemyLifecycleTest, UnfreezeWithoutFreezeIsNoOp) {
    EnemyLifecycle lifecycle(world, bus);
    makeEnemy();
    EXPECT_EQ(lifecycle.unfreezeAllEnemies(active), 0);
}

TEST_F(EnemyLifecycleTest, FrozenEnemyDoesNotPursue) {
    EnemyLifecycle lifecycle(world, bus);
    Entity e = makeEnemy({1000.0f, 0.0f, 0.0f});
    lifecycle.freezeAllEnemies(active);
    lifecycle.setPursuitTarget(Vec3{});

    ASSERT_TRUE(lifecycle.processEntityUpdate(e, 0.1f));
    auto& body = world.registry().get<Rigidbody>(e);
    EXPECT_FLOAT_EQ(body.linearVelocity.lengthSquared(), 0.0f);
}

// =============================================================================
// Limit enforcement
// =============================================================================

TEST_F(EnemyLifecycleTest, EnforceLimitRemovesOldestFirst) {
    EnemyLifecycle lifecycle(world, bus);
    std::vector<Entity> enemies;
    for (int i = 0; i < 5; ++i) {
        enemies.push_back(makeEnemy({static_cast<float>(i), 0.0f, 0.0f}));
    }
    int explosions = 0;
    bus.subscribe(events::VfxExplosion, [&explosions](const EventData& data) {
        EXPECT_FLOAT_EQ(data.getFloat("scale"), 1.0f);
        ++explosions;
        return false;
    });

    std::vector<Entity> released;
    int removed = lifecycle.enforceEnemyLimit(active, 3, [this, &released](Entity e) {
        world.setRole(e, Role::Pooled);
        released.push_back(e);
    });

    EXPECT_EQ(removed, 2);
    EXPECT_EQ(explosions, 2);
    ASSERT_EQ(released.size(), 2u);
    EXPECT_EQ(released[0], enemies[0]);
    EXPECT_EQ(released[1], enemies[1]);
    EXPECT_EQ(active.size(), 3u);
}

TEST_F(EnemyLifecycleTest, EnforceLimitWithoutReleaseFnDestroys) {
    EnemyLifecycle lifecycle(world, bus);
    Entity oldest = makeEnemy();
    makeEnemy();

    EXPECT_EQ(lifecycle.enforceEnemyLimit(active, 1, ReleaseFn{}), 1);
    EXPECT_FALSE(world.isAlive(oldest));
    EXPECT_EQ(active.size(), 1u);
}

TEST_F(EnemyLifecycleTest, EnforceLimitIntoPoolKeepsRolesConsistent) {
    EnemyLifecycle lifecycle(world, bus);
    PoolSettings settings;
    EntityPool pool(world, settings);
    for (int i = 0; i < 4; ++i) makeEnemy();

    lifecycle.enforceEnemyLimit(active, 2, [&pool](Entity e) { pool.release(e); });

    EXPECT_EQ(active.size(), 2u);
    EXPECT_EQ(pool.size(), 2u);
    EXPECT_EQ(pool.runDiagnostics(active), 0);
}

TEST_F(EnemyLifecycleTest, WithinLimitRemovesNothing) {
    EnemyLifecycle lifecycle(world, bus);
    makeEnemy();
    EXPECT_EQ(lifecycle.enforceEnemyLimit(active, 10, ReleaseFn{}), 0);
    EXPECT_EQ(bus.publishCount(events::VfxExplosion), 0u);
}

// =============================================================================
// Per-entity update
// =============================================================================

TEST_F(EnemyLifecycleTest, UpdateAttachesOnceAndMirrorsTransform) {
    EnemyLifecycle lifecycle(world, bus);
    Entity e = makeEnemy({10.0f, 20.0f, 30.0f});

    ASSERT_TRUE(lifecycle.processEntityUpdate(e, 0.016f));
    ASSERT_TRUE(lifecycle.processEntityUpdate(e, 0.016f));
    EXPECT_EQ(lifecycle.sceneAttachCount(), 1u);
    EXPECT_TRUE(world.scene().isAttached(e));

    const auto& mesh = world.registry().get<RenderMesh>(e);
    EXPECT_FLOAT_EQ(mesh.position.y, 20.0f);
}

TEST_F(EnemyLifecycleTest, UpdateSkipsEntityWithoutMesh) {
    EnemyLifecycle lifecycle(world, bus);
    Entity e = makeEnemy();
    world.registry().remove<RenderMesh>(e);
    EXPECT_FALSE(lifecycle.processEntityUpdate(e, 0.016f));

    world.destroyEntity(e);
    EXPECT_FALSE(lifecycle.processEntityUpdate(e, 0.016f));
}

TEST_F(EnemyLifecycleTest, ElitePulsesOnInterval) {
    EnemyLifecycle lifecycle(world, bus);
    Entity e = makeEnemy({}, VisualVariant::Elite);
    int pulses = 0;
    bus.subscribe(events::VfxPulse, [&pulses, e](const EventData& data) {
        EXPECT_EQ(data.getEntity("entity"), e);
        EXPECT_EQ(data.getInt("color"), 0xaaffff);
        ++pulses;
        return false;
    });

    for (int i = 0; i < 10; ++i) lifecycle.processEntityUpdate(e, 0.1f);
    EXPECT_EQ(pulses, 0);
    for (int i = 0; i < 6; ++i) lifecycle.processEntityUpdate(e, 0.1f);
    EXPECT_EQ(pulses, 1);
    EXPECT_GT(world.registry().get<RenderMesh>(e).childAnimationTime, 1.5f);
}

TEST_F(EnemyLifecycleTest, DamagedVariantFlickers) {
    EnemyLifecycle lifecycle(world, bus);
    Entity e = makeEnemy({}, VisualVariant::Damaged);
    lifecycle.processEntityUpdate(e, 0.05f);
    float intensity = world.registry().get<RenderMesh>(e).emissiveIntensity;
    EXPECT_GE(intensity, 0.2f);
    EXPECT_LE(intensity, 0.8f);
}

TEST_F(EnemyLifecycleTest, UpdateSteersTowardTarget) {
    EnemyLifecycle lifecycle(world, bus);
    Entity e = makeEnemy({2000.0f, 0.0f, 0.0f});
    world.registry().get<EnemyAI>(e).spiralAmplitude = 0.0f;
    lifecycle.setPursuitTarget(Vec3{});

    lifecycle.processEntityUpdate(e, 0.016f);
    EXPECT_LT(world.registry().get<Rigidbody>(e).linearVelocity.x, 0.0f);
}
