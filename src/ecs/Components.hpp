#pragma once

#include "ecs/Entity.hpp"
#include "engine/Vec3.hpp"
#include "render/MeshGeometry.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <memory>
#include <random>

namespace spectral {

/// Authoritative role of an entity. Every entity carries exactly one; there
/// is no secondary tag set that could disagree with it.
enum class Role : uint8_t {
    None,
    Pooled,
    ActiveEnemy,
    Player,
    Projectile,       ///< Fired by the player side
    EnemyProjectile,  ///< Fired by the enemy side
    Effect
};

const char* roleName(Role role);

/// Role component
struct EntityRole {
    Role role = Role::None;

    constexpr EntityRole() = default;
    constexpr EntityRole(Role r) : role(r) {}
};

/// Marks a frozen enemy and remembers its AI-enabled flag from before freezing
struct Frozen {
    bool savedAiEnabled = true;

    constexpr Frozen() = default;
    constexpr Frozen(bool saved) : savedAiEnabled(saved) {}
};

/// Transform component - position, Euler rotation (radians) and scale
struct Transform {
    Vec3 position{0.0f, 0.0f, 0.0f};
    Vec3 rotation{0.0f, 0.0f, 0.0f};
    Vec3 scale{1.0f, 1.0f, 1.0f};

    constexpr Transform() = default;
    constexpr Transform(Vec3 pos) : position(pos) {}
    constexpr Transform(Vec3 pos, Vec3 rot, Vec3 scl)
        : position(pos), rotation(rot), scale(scl) {}
};

/// Rigidbody component - linear and angular velocity
struct Rigidbody {
    Vec3 linearVelocity{0.0f, 0.0f, 0.0f};   // Units per second
    Vec3 angularVelocity{0.0f, 0.0f, 0.0f};  // Radians per second
    float mass = 1.0f;

    constexpr Rigidbody() = default;
    constexpr Rigidbody(Vec3 vel) : linearVelocity(vel) {}

    void stop() {
        linearVelocity = {};
        angularVelocity = {};
    }
};

/// Outcome of a single Health::applyDamage call
struct DamageResult {
    float damageApplied = 0.0f;  ///< After resistance
    float shieldDamage = 0.0f;
    float healthDamage = 0.0f;
    bool destroyed = false;      ///< True only on the hit that destroyed the entity
};

/// Health component with a regenerating shield layer
struct Health {
    float health = 100.0f;
    float maxHealth = 100.0f;
    float shield = 0.0f;
    float maxShield = 0.0f;
    float resistance = 0.0f;         ///< Fraction of incoming damage ignored (0-1)
    float shieldRegenRate = 10.0f;   ///< Shield points per second
    float shieldRegenDelay = 3.0f;   ///< Seconds after the last hit before regen starts
    float timeSinceDamage = 0.0f;
    bool destroyed = false;

    Health() = default;
    Health(float hp) : health(hp), maxHealth(hp) {}
    Health(float hp, float shieldPoints)
        : health(hp), maxHealth(hp), shield(shieldPoints), maxShield(shieldPoints) {}

    /// Shield absorbs first, the remainder goes to health.
    DamageResult applyDamage(float amount) {
        DamageResult result;
        if (destroyed || amount <= 0.0f) {
            return result;
        }

        float remaining = amount * (1.0f - std::clamp(resistance, 0.0f, 1.0f));
        result.damageApplied = remaining;

        if (shield > 0.0f) {
            result.shieldDamage = std::min(shield, remaining);
            shield -= result.shieldDamage;
            remaining -= result.shieldDamage;
        }

        if (remaining > 0.0f) {
            result.healthDamage = std::min(health, remaining);
            health -= result.healthDamage;
        }

        timeSinceDamage = 0.0f;
        if (health <= 0.0f) {
            health = 0.0f;
            destroyed = true;
            result.destroyed = true;
        }
        return result;
    }

    /// Restore full health and shield, clearing the destroyed flag
    void reset(float hp, float shieldPoints = 0.0f) {
        health = maxHealth = hp;
        shield = maxShield = shieldPoints;
        timeSinceDamage = 0.0f;
        destroyed = false;
    }

    /// Shield regeneration tick
    void update(float dt) {
        if (destroyed) return;
        timeSinceDamage += dt;
        if (shield < maxShield && timeSinceDamage >= shieldRegenDelay) {
            shield = std::min(maxShield, shield + shieldRegenRate * dt);
        }
    }

    bool isDestroyed() const { return destroyed; }
    float getPercentage() const { return maxHealth > 0.0f ? health / maxHealth : 0.0f; }
};

/// Enemy subtype, scaling the shared enemy config
enum class EnemySubtype : uint8_t { Standard, Heavy, Swift };

/// Cosmetic variant of an enemy
enum class VisualVariant : uint8_t { Standard, Damaged, Elite, Overcharged };

/// Enemy AI component - spiral pursuit of a target position
struct EnemyAI {
    bool enabled = true;
    float speed = 700.0f;
    float spiralAmplitude = 150.0f;
    float spiralFrequency = 2.0f;   ///< Revolutions per second around the approach axis
    float spiralPhase = 0.0f;       ///< Radians
    float timeAlive = 0.0f;
    float damage = 15.0f;
    float collisionRadius = 50.0f;
    float stopDistance = 300.0f;    ///< Holds position inside this distance of the target
    EnemySubtype subtype = EnemySubtype::Standard;

    /// Clear timers and re-seed the spiral phase for a recycled entity
    template<typename Rng>
    void reset(Rng& rng) {
        std::uniform_real_distribution<float> phase(0.0f, 6.2831853f);
        spiralPhase = phase(rng);
        timeAlive = 0.0f;
        enabled = true;
    }

    /// Advance the pursuit and write the desired velocity into the rigidbody.
    /// With no target the enemy drifts to a stop.
    void update(float dt, const Transform& transform, Rigidbody& body, const Vec3* target) {
        if (!enabled) return;

        timeAlive += dt;
        spiralPhase = std::fmod(spiralPhase + spiralFrequency * 6.2831853f * dt, 6.2831853f);

        if (!target) {
            body.linearVelocity *= 0.9f;
            return;
        }

        Vec3 toTarget = *target - transform.position;
        float distance = toTarget.length();
        if (distance < 1e-3f) {
            body.linearVelocity = {};
            return;
        }
        Vec3 dir = toTarget / distance;

        // Basis perpendicular to the approach direction for the spiral offset
        Vec3 up = std::fabs(dir.y) > 0.99f ? Vec3(1.0f, 0.0f, 0.0f) : Vec3(0.0f, 1.0f, 0.0f);
        Vec3 right = Vec3::cross(dir, up).normalized();
        Vec3 ortho = Vec3::cross(right, dir);

        float approach = distance > stopDistance ? speed : 0.0f;
        Vec3 swirl = (right * std::cos(spiralPhase) + ortho * std::sin(spiralPhase))
                     * (spiralAmplitude * spiralFrequency);
        body.linearVelocity = dir * approach + swirl;
    }
};

/// Per-variant cosmetic animation state
struct VariantState {
    VisualVariant variant = VisualVariant::Standard;
    float pulseTimer = 0.0f;   ///< Elite particle pulse accumulator
    float effectTime = 0.0f;   ///< Clock driving flicker and child animation

    constexpr VariantState() = default;
    constexpr VariantState(VisualVariant v) : variant(v) {}
};

/// Render-side mirror of an entity. The mesh lives in the scene graph once
/// attached; transform state is copied onto it every tick.
struct RenderMesh {
    std::shared_ptr<const MeshGeometry> geometry;
    bool visible = true;
    bool attached = false;     ///< Parented into the scene graph
    bool placeholder = false;  ///< Procedural stand-in for a failed asset
    Vec3 position{0.0f, 0.0f, 0.0f};
    Vec3 rotation{0.0f, 0.0f, 0.0f};
    Vec3 scale{1.0f, 1.0f, 1.0f};
    uint32_t color = 0x66ccff;
    float emissiveIntensity = 1.0f;
    float opacity = 1.0f;
    float childAnimationTime = 0.0f;
};

/// Secondary visual attached to an enemy; owns a scene graphics resource
struct TrailEffect {
    uint32_t resourceId = 0;
    float length = 200.0f;
};

/// Damage metadata carried by projectiles
struct ProjectileData {
    float damage = 10.0f;
    Entity source = NullEntity;

    constexpr ProjectileData() = default;
    constexpr ProjectileData(float dmg) : damage(dmg) {}
    constexpr ProjectileData(float dmg, Entity src) : damage(dmg), source(src) {}
};

/// Lifetime component - entity is destroyed once elapsed reaches duration
struct Lifetime {
    float duration = 1.0f;
    float elapsed = 0.0f;

    constexpr Lifetime() = default;
    constexpr Lifetime(float dur) : duration(dur) {}

    bool isExpired() const { return elapsed >= duration; }
};

/// Expanding, fading impact marker
struct HitEffect {
    float age = 0.0f;
    float duration = 0.25f;
    float size = 1.0f;
    bool active = false;
};

} // namespace spectral
