#pragma once

namespace spectral {

/// Enemy parameters for one difficulty level
struct DifficultyParams {
    int level = 1;
    float time = 0.0f;           ///< Game time (s) at which the level begins
    int maxEnemies = 10;
    float enemyHealth = 20.0f;
    float enemyDamage = 15.0f;
    float enemySpeed = 700.0f;
    float spawnInterval = 3.0f;
};

/// Read-only source of the current difficulty parameters
class IDifficultySource {
public:
    virtual ~IDifficultySource() = default;

    virtual DifficultyParams currentParams() const = 0;
};

} // namespace spectral
