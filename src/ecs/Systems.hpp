#pragma once

#include <algorithm>
#include <array>
#include <memory>
#include <string>
#include <vector>

namespace spectral {

/// System execution phase
enum class SystemPhase {
    PreUpdate,      // Before main update (player input, weapons)
    Update,         // Main update (movement, enemies)
    PostUpdate      // After main update (collision, cleanup)
};

/// Base class for all per-tick systems. Collaborators are passed to the
/// concrete system's constructor.
class System {
public:
    explicit System(const std::string& name, int priority = 0)
        : m_name(name), m_priority(priority) {}
    virtual ~System() = default;

    System(const System&) = delete;
    System& operator=(const System&) = delete;

    /// Update the system (called every fixed step)
    virtual void update(float dt) = 0;

    /// Release subscriptions and timers; may be called more than once
    virtual void shutdown() {}

    const std::string& getName() const { return m_name; }

    /// Get execution priority (lower = earlier)
    int getPriority() const { return m_priority; }

    void setEnabled(bool enabled) { m_enabled = enabled; }
    bool isEnabled() const { return m_enabled; }

private:
    std::string m_name;
    int m_priority = 0;
    bool m_enabled = true;
};

/// Owns the per-tick systems and runs them phase by phase, each phase in
/// priority order.
class SystemScheduler {
public:
    static constexpr size_t PHASE_COUNT = 3;

    SystemScheduler() = default;
    ~SystemScheduler() { shutdown(); }

    SystemScheduler(const SystemScheduler&) = delete;
    SystemScheduler& operator=(const SystemScheduler&) = delete;

    /// Construct a system in place and add it to a phase
    template<typename T, typename... Args>
    T* addSystem(SystemPhase phase, Args&&... args) {
        auto& systems = m_phases[index(phase)];
        systems.push_back(std::make_unique<T>(std::forward<Args>(args)...));
        T* added = static_cast<T*>(systems.back().get());
        std::stable_sort(systems.begin(), systems.end(),
            [](const std::unique_ptr<System>& a, const std::unique_ptr<System>& b) {
                return a->getPriority() < b->getPriority();
            });
        return added;
    }

    System* getSystem(const std::string& name) {
        for (auto& systems : m_phases) {
            for (auto& system : systems) {
                if (system->getName() == name) return system.get();
            }
        }
        return nullptr;
    }

    void runPhase(SystemPhase phase, float dt) {
        for (auto& system : m_phases[index(phase)]) {
            if (system->isEnabled()) {
                system->update(dt);
            }
        }
    }

    /// One fixed step: PreUpdate, Update, PostUpdate
    void update(float dt) {
        runPhase(SystemPhase::PreUpdate, dt);
        runPhase(SystemPhase::Update, dt);
        runPhase(SystemPhase::PostUpdate, dt);
    }

    /// Shut down and drop every system, latest phase first
    void shutdown() {
        for (size_t i = PHASE_COUNT; i-- > 0;) {
            for (auto& system : m_phases[i]) {
                system->shutdown();
            }
            m_phases[i].clear();
        }
    }

    size_t getTotalSystemCount() const {
        size_t total = 0;
        for (const auto& systems : m_phases) total += systems.size();
        return total;
    }

private:
    static size_t index(SystemPhase phase) { return static_cast<size_t>(phase); }

    std::array<std::vector<std::unique_ptr<System>>, PHASE_COUNT> m_phases;
};

} // namespace spectral
