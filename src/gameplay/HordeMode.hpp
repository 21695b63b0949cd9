#pragma once

#include "events/MessageBus.hpp"
#include "game/GameState.hpp"
#include "gameplay/Leaderboard.hpp"

#include <string>
#include <vector>

namespace spectral {

/// Milestone bosses
enum class HordeBoss { None, Sentinel, Reaper, Leviathan };

const char* bossName(HordeBoss boss);

/// Progress of the current horde run
struct WaveState {
    int currentWave = 0;
    int enemiesInWave = 0;
    int enemiesRemaining = 0;
    float waveStartTime = 0.0f;   ///< Survival time at which the wave began
    int score = 0;
};

/// Result of a finished run
struct HordeRunSummary {
    int score = 0;
    int wave = 0;
    float survivalTimeSeconds = 0.0f;
    bool newHighScore = false;
};

/// Endless survival waves. Inactive until activate(); each cleared wave
/// immediately starts the next one. Only endRun() leaves the mode.
class HordeMode {
public:
    static constexpr int POINTS_PER_KILL = 100;
    static constexpr int POINTS_PER_WAVE = 500;

    HordeMode(MessageBus& bus, GameState& gameState, Leaderboard& leaderboard);

    /// Reset the run and start wave 1. Forces an undock first: horde mode
    /// cannot run while docked.
    void activate();

    void startWave();
    void onEnemyDestroyed();
    void onWaveComplete();

    /// Accumulate survival time while active
    void update(float dt);

    /// Leave horde mode and record the run on the leaderboard
    HordeRunSummary endRun();

    bool isActive() const { return m_active; }
    const WaveState& waveState() const { return m_wave; }
    int score() const { return m_wave.score; }
    int currentWave() const { return m_wave.currentWave; }
    float survivalTime() const { return m_survivalTime; }

    /// Survival time as MM:SS
    std::string getFormattedSurvivalTime() const;

    std::vector<HighScoreEntry> getHighScores() const { return m_leaderboard.getHighScores(); }
    bool isNewHighScore(int score) const { return m_leaderboard.isNewHighScore(score); }

    /// Record the current run on the leaderboard
    bool saveHighScore();

    /// Enemies in a wave: 10 in wave 1, five more each wave after
    static int enemiesInWave(int wave);

    /// Boss for a wave, first matching rule wins:
    /// %5 (not %10) -> Sentinel, else %7 (not %10) -> Reaper, else %10 -> Leviathan
    static HordeBoss bossForWave(int wave);

    static float healthMultiplier(int wave) { return 1.0f + 0.1f * static_cast<float>(wave - 1); }
    static float speedMultiplier(int wave) { return 1.0f + 0.05f * static_cast<float>(wave - 1); }

private:
    MessageBus& m_bus;
    GameState& m_gameState;
    Leaderboard& m_leaderboard;

    bool m_active = false;
    float m_survivalTime = 0.0f;
    WaveState m_wave;
};

} // namespace spectral
