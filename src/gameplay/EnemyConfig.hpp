#pragma once

#include "ecs/Components.hpp"

#include <random>

namespace spectral {

/// Shared enemy parameters, recomputed every tick by DifficultyScaling and
/// read by the spawner at spawn time.
struct EnemyConfig {
    float health = 20.0f;
    float damage = 15.0f;
    float speed = 700.0f;
    float spiralAmplitude = 150.0f;
    float spiralFrequency = 2.0f;
    float spawnInterval = 3.0f;
    int maxEnemies = 10;
};

/// Multipliers a subtype applies on top of EnemyConfig
struct SubtypeProfile {
    EnemySubtype subtype = EnemySubtype::Standard;
    const char* name = "standard";
    float spawnWeight = 60.0f;
    float healthMultiplier = 1.0f;
    float damageMultiplier = 1.0f;
    float speedMultiplier = 1.0f;
    float sizeMultiplier = 1.0f;
    float collisionRadius = 50.0f;
};

/// Base visual size of a standard drone, in world units
constexpr float ENEMY_BASE_SIZE = 80.0f;

const SubtypeProfile& subtypeProfile(EnemySubtype subtype);

/// Weighted random pick over Standard/Heavy/Swift
EnemySubtype selectSubtype(std::mt19937& rng);

/// Weighted random pick of the cosmetic variant (70/15/10/5)
VisualVariant rollVariant(std::mt19937& rng);

const char* variantName(VisualVariant variant);

} // namespace spectral
