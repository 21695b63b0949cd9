#include "difficulty/TimedDifficultyManager.hpp"
#include "engine/Log.hpp"
#include "events/Events.hpp"
#include "events/MessageBus.hpp"

#include <algorithm>

namespace spectral {

std::vector<DifficultyParams> TimedDifficultyManager::defaultLevels() {
    //       level  time   max  health damage speed    interval
    return {
        {1,    0.0f, 10, 20.0f, 15.0f,  700.0f, 3.0f},
        {2,  120.0f, 15, 30.0f, 20.0f,  800.0f, 2.5f},
        {3,  300.0f, 20, 40.0f, 25.0f,  900.0f, 2.0f},
        {4,  600.0f, 25, 60.0f, 30.0f, 1000.0f, 1.5f},
        {5,  900.0f, 30, 80.0f, 40.0f, 1200.0f, 1.0f},
    };
}

TimedDifficultyManager::TimedDifficultyManager(MessageBus& bus)
    : m_bus(bus) {
    setLevels(defaultLevels());
}

void TimedDifficultyManager::setLevels(std::vector<DifficultyParams> levels) {
    if (levels.empty()) {
        LOG_WARN("TimedDifficultyManager: empty level table, keeping defaults");
        levels = defaultLevels();
    }
    std::stable_sort(levels.begin(), levels.end(),
        [](const DifficultyParams& a, const DifficultyParams& b) { return a.time < b.time; });
    m_levels = std::move(levels);
    reset();
}

void TimedDifficultyManager::reset() {
    m_gameTime = 0.0f;
    m_currentLevel = 1;
    m_params = m_levels.front();
}

void TimedDifficultyManager::update(float dt) {
    if (m_paused) return;
    m_gameTime += dt;

    int newLevel = m_currentLevel;
    for (size_t i = m_levels.size(); i-- > 0;) {
        if (m_gameTime >= m_levels[i].time) {
            newLevel = static_cast<int>(i) + 1;
            break;
        }
    }

    if (newLevel != m_currentLevel) {
        m_currentLevel = newLevel;
        m_params = m_levels[static_cast<size_t>(newLevel - 1)];
        LOG_INFO("Difficulty increased to level {} at {}s", newLevel, static_cast<int>(m_gameTime));

        EventData data;
        data.setInt("level", newLevel);
        data.setFloat("time", m_gameTime);
        m_bus.publish(events::DifficultyLevelUp, data);
    }
}

float TimedDifficultyManager::getTimeUntilNextLevel() const {
    if (static_cast<size_t>(m_currentLevel) >= m_levels.size()) {
        return -1.0f;
    }
    return std::max(0.0f, m_levels[static_cast<size_t>(m_currentLevel)].time - m_gameTime);
}

} // namespace spectral
