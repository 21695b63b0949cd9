#pragma once

#include <entt/entt.hpp>

#include <cstdint>

namespace spectral {

/// Stable generational entity handle (slot index + version). A destroyed
/// entity's handle stays invalid even after its slot is recycled.
using Entity = entt::entity;

/// Null entity constant
constexpr Entity NullEntity = entt::null;

/// Numeric form of a handle, for logs and message payloads
inline uint32_t toIntegral(Entity entity) {
    return static_cast<uint32_t>(entt::to_integral(entity));
}

} // namespace spectral
