#include <gtest/gtest.h>
#include "ecs/World.hpp"
#include "ecs/CoreSystems.hpp"
#include "ecs/Systems.hpp"
#include "engine/Log.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace spectral;

class WorldTest : public ::testing::Test {
protected:
    void SetUp() override {
        Log::init("", "off");
    }

    World world;
};

// =============================================================================
// Registry
// =============================================================================

TEST_F(WorldTest, RegistryTypedComponents) {
    auto& registry = world.registry();
    Entity e = registry.create();
    registry.add<Transform>(e, Transform(Vec3(1.0f, 2.0f, 3.0f)));
    registry.add<Health>(e, Health(50.0f));

    ASSERT_TRUE(registry.hasAll<Transform, Health>(e));
    EXPECT_FLOAT_EQ(registry.get<Transform>(e).position.y, 2.0f);
    EXPECT_FLOAT_EQ(registry.get<Health>(e).maxHealth, 50.0f);
    EXPECT_EQ(registry.tryGet<Rigidbody>(e), nullptr);

    registry.remove<Health>(e);
    EXPECT_FALSE(registry.has<Health>(e));
}

TEST_F(WorldTest, StaleHandleLookupsAreSafe) {
    auto& registry = world.registry();
    Entity e = world.createEntity(Role::ActiveEnemy);
    registry.add<Transform>(e);
    world.destroyEntity(e);

    EXPECT_FALSE(world.isAlive(e));
    EXPECT_EQ(registry.tryGet<Transform>(e), nullptr);
    EXPECT_FALSE(registry.has<Transform>(e));
    EXPECT_EQ(world.roleOf(e), Role::None);
    EXPECT_FALSE(world.positionOf(e).has_value());
    EXPECT_NO_THROW(world.destroyEntity(e));
    EXPECT_NO_THROW(registry.remove<Transform>(e));
}

TEST_F(WorldTest, RecycledSlotGetsNewGeneration) {
    Entity first = world.createEntity(Role::ActiveEnemy);
    world.destroyEntity(first);
    Entity second = world.createEntity(Role::Player);

    EXPECT_NE(first, second);
    EXPECT_FALSE(world.isAlive(first));
    EXPECT_TRUE(world.isAlive(second));
}

// =============================================================================
// Roles
// =============================================================================

TEST_F(WorldTest, EveryEntityCarriesExactlyOneRole) {
    Entity e = world.createEntity(Role::Pooled);
    EXPECT_EQ(world.roleOf(e), Role::Pooled);

    world.setRole(e, Role::ActiveEnemy);
    EXPECT_EQ(world.roleOf(e), Role::ActiveEnemy);
    EXPECT_EQ(world.entityCount(), 1u);
}

TEST_F(WorldTest, EntitiesWithRole) {
    Entity a = world.createEntity(Role::ActiveEnemy);
    Entity b = world.createEntity(Role::ActiveEnemy);
    world.createEntity(Role::Pooled);
    world.createEntity(Role::Player);

    auto enemies = world.entitiesWithRole(Role::ActiveEnemy);
    ASSERT_EQ(enemies.size(), 2u);
    EXPECT_NE(std::find(enemies.begin(), enemies.end(), a), enemies.end());
    EXPECT_NE(std::find(enemies.begin(), enemies.end(), b), enemies.end());
    EXPECT_EQ(world.entityCount(), 4u);
}

TEST_F(WorldTest, SetRoleOnDeadEntityIsIgnored) {
    Entity e = world.createEntity(Role::ActiveEnemy);
    world.destroyEntity(e);
    EXPECT_NO_THROW(world.setRole(e, Role::Pooled));
    EXPECT_FALSE(world.isAlive(e));
}

TEST_F(WorldTest, RoleNames) {
    EXPECT_STREQ(roleName(Role::Pooled), "pooled");
    EXPECT_STREQ(roleName(Role::ActiveEnemy), "enemy");
    EXPECT_STREQ(roleName(Role::EnemyProjectile), "enemyProjectile");
}

// =============================================================================
// Scene graph and resources
// =============================================================================

TEST_F(WorldTest, DestroyDisposesTrailAndDetaches) {
    Entity e = world.createEntity(Role::ActiveEnemy);
    uint32_t trail = world.scene().createResource("trail");
    world.registry().add<TrailEffect>(e).resourceId = trail;
    ASSERT_TRUE(world.scene().attach(e));
    EXPECT_FALSE(world.scene().attach(e));

    world.destroyEntity(e);
    EXPECT_FALSE(world.scene().isResourceLive(trail));
    EXPECT_FALSE(world.scene().isAttached(e));
    EXPECT_EQ(world.scene().liveResourceCount(), 0u);
}

TEST_F(WorldTest, DisposeResourceTwiceFails) {
    uint32_t id = world.scene().createResource("trail");
    EXPECT_TRUE(world.scene().disposeResource(id));
    EXPECT_FALSE(world.scene().disposeResource(id));
}

TEST_F(WorldTest, PlayerRegistration) {
    EXPECT_EQ(world.player(), NullEntity);
    Entity ship = world.createEntity(Role::Player);
    world.registry().add<Transform>(ship, Transform(Vec3(5.0f, 0.0f, 0.0f)));
    world.setPlayer(ship);
    EXPECT_EQ(world.player(), ship);

    world.destroyEntity(ship);
    EXPECT_EQ(world.player(), NullEntity);
}

// =============================================================================
// Components
// =============================================================================

TEST(HealthTest, ShieldAbsorbsFirst) {
    Health health(20.0f, 10.0f);
    DamageResult result = health.applyDamage(15.0f);

    EXPECT_FLOAT_EQ(result.shieldDamage, 10.0f);
    EXPECT_FLOAT_EQ(result.healthDamage, 5.0f);
    EXPECT_FLOAT_EQ(health.shield, 0.0f);
    EXPECT_FLOAT_EQ(health.health, 15.0f);
    EXPECT_FALSE(result.destroyed);
}

TEST(HealthTest, DestroyedOnlyOnce) {
    Health health(10.0f);
    EXPECT_TRUE(health.applyDamage(25.0f).destroyed);
    EXPECT_TRUE(health.isDestroyed());
    DamageResult again = health.applyDamage(5.0f);
    EXPECT_FALSE(again.destroyed);
    EXPECT_FLOAT_EQ(again.damageApplied, 0.0f);
}

TEST(HealthTest, ResistanceReducesDamage) {
    Health health(100.0f);
    health.resistance = 0.25f;
    DamageResult result = health.applyDamage(40.0f);
    EXPECT_FLOAT_EQ(result.damageApplied, 30.0f);
    EXPECT_FLOAT_EQ(health.health, 70.0f);
}

TEST(HealthTest, ShieldRegeneratesAfterDelay) {
    Health health(20.0f, 10.0f);
    health.applyDamage(10.0f);
    health.update(2.0f);
    EXPECT_FLOAT_EQ(health.shield, 0.0f);
    health.update(1.0f);
    EXPECT_GT(health.shield, 0.0f);
    health.update(10.0f);
    EXPECT_FLOAT_EQ(health.shield, 10.0f);
}

TEST(EnemyAITest, PursuesTargetOutsideStopDistance) {
    EnemyAI ai;
    ai.spiralAmplitude = 0.0f;
    Transform transform(Vec3(0.0f, 0.0f, 0.0f));
    Rigidbody body;
    Vec3 target(1000.0f, 0.0f, 0.0f);

    ai.update(0.1f, transform, body, &target);
    EXPECT_NEAR(body.linearVelocity.x, ai.speed, 0.01f);
    EXPECT_NEAR(body.linearVelocity.y, 0.0f, 0.01f);
    EXPECT_FLOAT_EQ(ai.timeAlive, 0.1f);
}

TEST(EnemyAITest, DriftsToStopWithoutTarget) {
    EnemyAI ai;
    Transform transform;
    Rigidbody body(Vec3(100.0f, 0.0f, 0.0f));
    ai.update(0.1f, transform, body, nullptr);
    EXPECT_FLOAT_EQ(body.linearVelocity.x, 90.0f);
}

TEST(EnemyAITest, DisabledAIDoesNothing) {
    EnemyAI ai;
    ai.enabled = false;
    Transform transform;
    Rigidbody body(Vec3(100.0f, 0.0f, 0.0f));
    Vec3 target(1000.0f, 0.0f, 0.0f);
    ai.update(0.1f, transform, body, &target);
    EXPECT_FLOAT_EQ(body.linearVelocity.x, 100.0f);
    EXPECT_FLOAT_EQ(ai.timeAlive, 0.0f);
}

// =============================================================================
// Systems
// =============================================================================

namespace {

class CountingSystem : public System {
public:
    CountingSystem(const std::string& name, int priority, std::vector<std::string>& log)
        : System(name, priority), m_log(log) {}
    void update(float) override { m_log.push_back(getName()); }

private:
    std::vector<std::string>& m_log;
};

} // namespace

TEST_F(WorldTest, SchedulerRunsPhasesInPriorityOrder) {
    std::vector<std::string> log;
    SystemScheduler scheduler;
    scheduler.addSystem<CountingSystem>(SystemPhase::PostUpdate, "post", 0, log);
    scheduler.addSystem<CountingSystem>(SystemPhase::Update, "late", 10, log);
    scheduler.addSystem<CountingSystem>(SystemPhase::Update, "early", -10, log);
    scheduler.addSystem<CountingSystem>(SystemPhase::PreUpdate, "pre", 0, log);

    scheduler.update(0.016f);
    ASSERT_EQ(log.size(), 4u);
    EXPECT_EQ(log[0], "pre");
    EXPECT_EQ(log[1], "early");
    EXPECT_EQ(log[2], "late");
    EXPECT_EQ(log[3], "post");
    EXPECT_EQ(scheduler.getTotalSystemCount(), 4u);
}

TEST_F(WorldTest, DisabledSystemIsSkipped) {
    std::vector<std::string> log;
    SystemScheduler scheduler;
    auto* system = scheduler.addSystem<CountingSystem>(SystemPhase::Update, "counted", 0, log);
    system->setEnabled(false);
    scheduler.update(0.016f);
    EXPECT_TRUE(log.empty());
    EXPECT_EQ(scheduler.getSystem("counted"), system);
}

TEST_F(WorldTest, MovementSkipsPooledAndFrozen) {
    auto& registry = world.registry();
    Entity moving = world.createEntity(Role::ActiveEnemy);
    Entity pooled = world.createEntity(Role::Pooled);
    Entity frozen = world.createEntity(Role::ActiveEnemy);
    for (Entity e : {moving, pooled, frozen}) {
        registry.add<Transform>(e);
        registry.add<Rigidbody>(e, Rigidbody(Vec3(10.0f, 0.0f, 0.0f)));
    }
    registry.add<Frozen>(frozen);

    MovementSystem movement(world);
    movement.update(1.0f);

    EXPECT_FLOAT_EQ(registry.get<Transform>(moving).position.x, 10.0f);
    EXPECT_FLOAT_EQ(registry.get<Transform>(pooled).position.x, 0.0f);
    EXPECT_FLOAT_EQ(registry.get<Transform>(frozen).position.x, 0.0f);
}

TEST_F(WorldTest, LifetimeDestroysExpiredEntities) {
    Entity shot = world.createEntity(Role::Projectile);
    world.registry().add<Lifetime>(shot, Lifetime(0.5f));

    LifetimeSystem lifetime(world);
    lifetime.update(0.25f);
    EXPECT_TRUE(world.isAlive(shot));
    lifetime.update(0.25f);
    EXPECT_FALSE(world.isAlive(shot));
}
