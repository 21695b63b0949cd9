#include "gameplay/HordeMode.hpp"
#include "engine/Log.hpp"
#include "events/Events.hpp"

#include <cstdio>

namespace spectral {

const char* bossName(HordeBoss boss) {
    switch (boss) {
        case HordeBoss::None:      return "none";
        case HordeBoss::Sentinel:  return "sentinel";
        case HordeBoss::Reaper:    return "reaper";
        case HordeBoss::Leviathan: return "leviathan";
    }
    return "unknown";
}

HordeMode::HordeMode(MessageBus& bus, GameState& gameState, Leaderboard& leaderboard)
    : m_bus(bus)
    , m_gameState(gameState)
    , m_leaderboard(leaderboard) {
}

void HordeMode::activate() {
    if (m_active) {
        LOG_WARN("HordeMode: already active (wave {})", m_wave.currentWave);
        return;
    }

    m_wave = WaveState{};
    m_survivalTime = 0.0f;

    if (m_gameState.docked) {
        m_gameState.docked = false;
        EventData undock;
        undock.setBool("forced", true);
        undock.setString("reason", "horde_mode_activation");
        m_bus.publish(events::PlayerUndocked, undock);
        LOG_INFO("HordeMode: forced undock for activation");
    }

    m_active = true;
    m_gameState.hordeModeActive = true;
    m_bus.publish(events::HordeActivated);
    LOG_INFO("HordeMode: activated");

    startWave();
}

void HordeMode::startWave() {
    m_wave.currentWave += 1;
    m_wave.enemiesInWave = enemiesInWave(m_wave.currentWave);
    m_wave.enemiesRemaining = m_wave.enemiesInWave;
    m_wave.waveStartTime = m_survivalTime;

    const int wave = m_wave.currentWave;
    EventData data;
    data.setInt("wave", wave);
    data.setInt("enemies", m_wave.enemiesInWave);
    data.setFloat("healthMultiplier", healthMultiplier(wave));
    data.setFloat("speedMultiplier", speedMultiplier(wave));
    m_bus.publish(events::HordeWaveStart, data);
    LOG_INFO("HordeMode: wave {} started with {} enemies", wave, m_wave.enemiesInWave);

    HordeBoss boss = bossForWave(wave);
    if (boss != HordeBoss::None) {
        EventData bossData;
        bossData.setInt("wave", wave);
        bossData.setString("boss", bossName(boss));
        m_bus.publish(events::HordeBossSpawn, bossData);
        LOG_INFO("HordeMode: boss '{}' for wave {}", bossName(boss), wave);
    }
}

void HordeMode::onEnemyDestroyed() {
    if (!m_active) return;

    m_wave.score += POINTS_PER_KILL;
    if (m_wave.enemiesRemaining > 0) {
        m_wave.enemiesRemaining -= 1;
    }
    if (m_wave.enemiesRemaining == 0) {
        onWaveComplete();
    }
}

void HordeMode::onWaveComplete() {
    m_wave.score += POINTS_PER_WAVE;
    LOG_INFO("HordeMode: wave {} cleared in {:.1f}s, score {}", m_wave.currentWave,
             m_survivalTime - m_wave.waveStartTime, m_wave.score);
    startWave();
}

void HordeMode::update(float dt) {
    if (m_active) {
        m_survivalTime += dt;
    }
}

HordeRunSummary HordeMode::endRun() {
    HordeRunSummary summary;
    if (!m_active) {
        LOG_WARN("HordeMode: endRun called while inactive");
        return summary;
    }

    summary.score = m_wave.score;
    summary.wave = m_wave.currentWave;
    summary.survivalTimeSeconds = m_survivalTime;
    summary.newHighScore = saveHighScore();

    m_active = false;
    m_gameState.hordeModeActive = false;

    EventData data;
    data.setInt("score", summary.score);
    data.setInt("wave", summary.wave);
    data.setFloat("survivalTime", summary.survivalTimeSeconds);
    data.setBool("newHighScore", summary.newHighScore);
    m_bus.publish(events::HordeEnded, data);
    LOG_INFO("HordeMode: run ended at wave {} with score {} after {}", summary.wave, summary.score,
             getFormattedSurvivalTime());
    return summary;
}

std::string HordeMode::getFormattedSurvivalTime() const {
    int total = static_cast<int>(m_survivalTime);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%02d:%02d", total / 60, total % 60);
    return buffer;
}

bool HordeMode::saveHighScore() {
    return m_leaderboard.saveHighScore(m_wave.score, m_wave.currentWave, m_survivalTime);
}

int HordeMode::enemiesInWave(int wave) {
    return 10 + 5 * (wave > 0 ? wave - 1 : 0);
}

HordeBoss HordeMode::bossForWave(int wave) {
    if (wave <= 0) return HordeBoss::None;

    if (wave % 5 == 0 && wave % 10 != 0) {
        return HordeBoss::Sentinel;
    } else if (wave % 7 == 0 && wave % 10 != 0) {
        return HordeBoss::Reaper;
    } else if (wave % 10 == 0) {
        return HordeBoss::Leviathan;
    }
    return HordeBoss::None;
}

} // namespace spectral
