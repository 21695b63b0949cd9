#include "engine/TimerQueue.hpp"
#include "engine/Log.hpp"

#include <algorithm>

namespace spectral {

TimerId TimerQueue::after(float delay, std::function<void()> callback) {
    TimerEntry entry;
    entry.id = allocateId();
    entry.delay = std::max(0.0f, delay);
    entry.remaining = entry.delay;
    entry.callback = std::move(callback);
    entry.repeating = false;
    m_timers.push_back(std::move(entry));
    return m_timers.back().id;
}

TimerId TimerQueue::every(float interval, std::function<void()> callback) {
    if (interval <= 0.0f) {
        LOG_WARN("TimerQueue::every: interval must be > 0");
        return InvalidTimerId;
    }
    TimerEntry entry;
    entry.id = allocateId();
    entry.delay = interval;
    entry.remaining = interval;
    entry.callback = std::move(callback);
    entry.repeating = true;
    m_timers.push_back(std::move(entry));
    return m_timers.back().id;
}

bool TimerQueue::cancel(TimerId id) {
    for (auto& timer : m_timers) {
        if (timer.id == id && !timer.cancelled) {
            timer.cancelled = true;
            return true;
        }
    }
    return false;
}

void TimerQueue::advance(float dt) {
    // Callbacks may schedule new timers, which would invalidate references
    // into m_timers; only the entries present at entry are ticked, by index.
    const size_t count = m_timers.size();
    for (size_t i = 0; i < count && i < m_timers.size(); ++i) {
        if (m_timers[i].cancelled || m_timers[i].paused) continue;

        m_timers[i].remaining -= dt;
        if (m_timers[i].remaining > 0.0f) continue;

        // Copy the callback so it survives a push_back from inside itself
        auto callback = m_timers[i].callback;
        const TimerId id = m_timers[i].id;
        if (callback) {
            try {
                callback();
            } catch (const std::exception& ex) {
                LOG_ERROR("Timer {} callback error: {}", id, ex.what());
            }
        }

        if (i >= m_timers.size()) break; // cleared from inside the callback

        TimerEntry& timer = m_timers[i];
        if (timer.repeating) {
            timer.remaining += timer.delay;
            // Prevent runaway if dt >> delay
            if (timer.remaining <= 0.0f) {
                timer.remaining = timer.delay;
            }
        } else {
            timer.cancelled = true;
        }
    }

    m_timers.erase(
        std::remove_if(m_timers.begin(), m_timers.end(),
            [](const TimerEntry& t) { return t.cancelled; }),
        m_timers.end());
}

void TimerQueue::clear() {
    m_timers.clear();
}

size_t TimerQueue::activeCount() const {
    size_t count = 0;
    for (const auto& timer : m_timers) {
        if (!timer.cancelled) ++count;
    }
    return count;
}

bool TimerQueue::setPaused(TimerId id, bool paused) {
    for (auto& timer : m_timers) {
        if (timer.id == id && !timer.cancelled) {
            timer.paused = paused;
            return true;
        }
    }
    return false;
}

TimerId TimerQueue::allocateId() {
    return m_nextId++;
}

} // namespace spectral
