#pragma once

#include "engine/Vec3.hpp"

#include <optional>

namespace spectral {

/// Shared game-level state read by the enemy pipeline.
struct GameState {
    bool docked = false;
    bool hordeModeActive = false;
    bool gameOver = false;
    std::optional<Vec3> shipPosition;  ///< Last known player ship position, if any
};

} // namespace spectral
