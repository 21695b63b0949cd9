#include "engine/Config.hpp"
#include "engine/Log.hpp"
#include "engine/Settings.hpp"
#include "sim/Simulation.hpp"

#include <atomic>
#include <csignal>
#include <string>

namespace {

std::atomic<bool> s_signalReceived{false};

void signalHandler(int) {
    s_signalReceived.store(true, std::memory_order_relaxed);
}

} // anonymous namespace

int main(int argc, char** argv) {
    const std::string configPath = argc > 1 ? argv[1] : "config.json";

    spectral::Config config;
    const bool configLoaded = config.loadFromFile(configPath);
    const auto settings = spectral::SpectralSettings::fromConfig(config);

    spectral::Log::init(settings.logging.file, settings.logging.level);
    if (!configLoaded) {
        LOG_WARN("Running with built-in defaults ({} not loaded)", configPath);
    }

    std::signal(SIGTERM, signalHandler);
    std::signal(SIGINT, signalHandler);

    spectral::Simulation sim(settings);
    if (settings.simulation.hordeMode) {
        sim.activateHorde();
    }

    LOG_INFO("Simulating {:.0f}s", settings.simulation.duration);
    while (sim.simulatedTime() < settings.simulation.duration && !sim.gameState().gameOver) {
        if (s_signalReceived.load(std::memory_order_relaxed)) {
            LOG_INFO("Termination signal received, stopping early");
            break;
        }
        sim.frame(settings.simulation.fixedTimestep);
    }
    if (sim.horde().isActive()) {
        sim.endHorde();
    }

    const auto report = sim.report();
    LOG_INFO("Simulated {:.1f}s in {} steps", report.simulatedSeconds, report.steps);
    LOG_INFO("Enemies: {} spawned, {} destroyed, {} active", report.enemiesSpawned,
             report.enemiesKilled, report.activeEnemies);
    LOG_INFO("Combat: {} shots, {} hits, {:.0f} damage dealt", report.shotsFired, report.combat.hits,
             report.combat.damageDealt);
    LOG_INFO("Pool: {} created, {} reused, {} released, {} destroyed", report.pool.created,
             report.pool.reused, report.pool.released, report.pool.destroyed);
    if (report.hordeMode) {
        LOG_INFO("Horde: wave {}, score {}, survived {:.0f}s{}", report.horde.wave, report.horde.score,
                 report.horde.survivalTimeSeconds, report.horde.newHighScore ? " (new high score)" : "");
    } else {
        LOG_INFO("Difficulty level reached: {}", report.difficultyLevel);
    }

    spectral::Log::shutdown();
    return 0;
}
