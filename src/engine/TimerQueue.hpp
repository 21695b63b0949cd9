#pragma once

#include <functional>
#include <vector>
#include <cstdint>

namespace spectral {

/// Unique identifier for a scheduled timer
using TimerId = uint32_t;

/// Invalid timer ID sentinel
constexpr TimerId InvalidTimerId = 0;

/// A scheduled timer entry
struct TimerEntry {
    TimerId id = InvalidTimerId;
    float delay = 0.0f;          // Interval for repeating timers, total delay for one-shots
    float remaining = 0.0f;      // Time remaining until next firing
    std::function<void()> callback;
    bool repeating = false;
    bool cancelled = false;      // Marked for removal
    bool paused = false;
};

/// Deferred work scheduler.
///
/// Runs work outside the per-system frame budget:
///   after(seconds, callback)   one-shot call (pool warm-up)
///   every(seconds, callback)   repeating call (spawn watchdog, diagnostics)
///   cancel(id)                 drop a pending timer
///
/// Timers scheduled from inside a callback start ticking on the next advance.
class TimerQueue {
public:
    TimerQueue() = default;

    /// Schedule a one-shot timer. A delay of zero fires on the next advance.
    TimerId after(float delay, std::function<void()> callback);

    /// Schedule a repeating timer. Returns InvalidTimerId for a non-positive interval.
    TimerId every(float interval, std::function<void()> callback);

    /// @return true if the timer existed and was cancelled
    bool cancel(TimerId id);

    /// Advance all timers by dt seconds and fire the ones that came due.
    void advance(float dt);

    void clear();

    size_t activeCount() const;

    bool setPaused(TimerId id, bool paused);

private:
    TimerId allocateId();

    std::vector<TimerEntry> m_timers;
    TimerId m_nextId = 1; // Start at 1 so 0 is the invalid sentinel
};

} // namespace spectral
