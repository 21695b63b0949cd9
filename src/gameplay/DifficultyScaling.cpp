#include "gameplay/DifficultyScaling.hpp"

#include <algorithm>
#include <cmath>

namespace spectral {

namespace {

constexpr float kBaseHealth = 20.0f;
constexpr float kBaseDamage = 15.0f;
constexpr float kBaseSpeed = 700.0f;
constexpr float kBaseSpawnInterval = 1.0f;

} // namespace

void DifficultyScaling::update(bool hordeActive, float survivalSeconds) {
    if (hordeActive) {
        applyHordeCurve(m_config, survivalSeconds);
    } else if (m_source) {
        applyParams(m_config, m_source->currentParams());
    }
}

int DifficultyScaling::hordeMaxEnemies(float minutes) {
    float count = minutes < HORDE_LINEAR_PHASE_MINUTES
        ? 50.0f + 10.0f * minutes
        : 100.0f * std::pow(1.2f, minutes - HORDE_LINEAR_PHASE_MINUTES);
    // Clamp before the int conversion; the exponential phase exceeds INT_MAX
    count = std::min(count, static_cast<float>(HORDE_MAX_ENEMIES));
    return static_cast<int>(std::floor(count));
}

float DifficultyScaling::hordeSpawnInterval(float minutes) {
    return std::max(HORDE_MIN_SPAWN_INTERVAL, kBaseSpawnInterval * std::pow(0.95f, minutes * 2.0f));
}

void DifficultyScaling::applyHordeCurve(EnemyConfig& config, float survivalSeconds) {
    const float minutes = std::max(0.0f, survivalSeconds) / 60.0f;

    config.maxEnemies = hordeMaxEnemies(minutes);
    config.spawnInterval = hordeSpawnInterval(minutes);
    config.health = std::floor(kBaseHealth * (1.0f + 0.5f * minutes));
    config.damage = std::floor(kBaseDamage * (1.0f + 0.3f * minutes));
    config.speed = kBaseSpeed * (1.0f + 0.2f * minutes);
}

void DifficultyScaling::applyParams(EnemyConfig& config, const DifficultyParams& params) {
    config.maxEnemies = params.maxEnemies;
    config.spawnInterval = params.spawnInterval;
    config.health = params.enemyHealth;
    config.damage = params.enemyDamage;
    config.speed = params.enemySpeed;
}

} // namespace spectral
