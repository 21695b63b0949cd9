#pragma once

#include "difficulty/IDifficultySource.hpp"

#include <vector>

namespace spectral {

class MessageBus;

/// Difficulty that steps up through fixed levels as game time passes.
class TimedDifficultyManager : public IDifficultySource {
public:
    explicit TimedDifficultyManager(MessageBus& bus);

    /// Replace the level table; entries must be sorted by time
    void setLevels(std::vector<DifficultyParams> levels);

    /// Advance game time and move to the highest level whose time has passed
    void update(float dt);

    DifficultyParams currentParams() const override { return m_params; }

    int getCurrentLevel() const { return m_currentLevel; }

    /// Seconds until the next level, or -1 at the last level
    float getTimeUntilNextLevel() const;

    float gameTime() const { return m_gameTime; }

    /// Horde mode drives its own curve; time stops while paused
    void setPaused(bool paused) { m_paused = paused; }
    bool isPaused() const { return m_paused; }

    void reset();

    /// Level table used when none is set
    static std::vector<DifficultyParams> defaultLevels();

private:
    MessageBus& m_bus;
    std::vector<DifficultyParams> m_levels;
    DifficultyParams m_params;
    int m_currentLevel = 1;
    float m_gameTime = 0.0f;
    bool m_paused = false;
};

} // namespace spectral
