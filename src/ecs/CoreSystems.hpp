#pragma once

#include "ecs/Systems.hpp"
#include "ecs/World.hpp"

#include <vector>

namespace spectral {

/// Integrates rigidbody velocity into transforms. Pooled and frozen
/// entities stay where they are.
class MovementSystem : public System {
public:
    explicit MovementSystem(World& world) : System("MovementSystem", 0), m_world(world) {}

    void update(float dt) override {
        auto& registry = m_world.registry();
        registry.each<Transform, Rigidbody, EntityRole>(
            [dt, &registry](Entity entity, Transform& transform, Rigidbody& body, EntityRole& role) {
                if (role.role == Role::Pooled || registry.has<Frozen>(entity)) return;
                transform.position += body.linearVelocity * dt;
                transform.rotation += body.angularVelocity * dt;
            });
    }

private:
    World& m_world;
};

/// Destroys entities whose Lifetime has run out (spent projectiles)
class LifetimeSystem : public System {
public:
    explicit LifetimeSystem(World& world) : System("LifetimeSystem", 100), m_world(world) {}

    void update(float dt) override {
        std::vector<Entity> toDestroy;

        m_world.registry().each<Lifetime>([dt, &toDestroy](Entity entity, Lifetime& lifetime) {
            lifetime.elapsed += dt;
            if (lifetime.isExpired()) {
                toDestroy.push_back(entity);
            }
        });

        for (Entity entity : toDestroy) {
            m_world.destroyEntity(entity);
        }
    }

private:
    World& m_world;
};

} // namespace spectral
