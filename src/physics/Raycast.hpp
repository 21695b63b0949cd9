#pragma once

#include "engine/Vec3.hpp"
#include "render/MeshGeometry.hpp"

#include <limits>

namespace spectral {

/// Result of a raycast
struct RaycastHit {
    bool hit = false;
    float distance = 0.0f;           // Distance along the ray to the hit point
    Vec3 point{0.0f, 0.0f, 0.0f};    // Hit point in world coordinates
    size_t triangle = 0;             // Index of the triangle that was hit

    operator bool() const { return hit; }
};

/// Ray structure for raycasting
struct Ray {
    Vec3 origin{0.0f, 0.0f, 0.0f};
    Vec3 direction{0.0f, 0.0f, 1.0f};   // Normalized

    Ray() = default;
    Ray(Vec3 origin, Vec3 direction)
        : origin(origin), direction(direction.normalized()) {}

    /// Get point along ray at distance t
    Vec3 getPoint(float t) const { return origin + direction * t; }
};

/// World placement of a mesh: translation, Euler rotation (radians, applied
/// X then Y then Z) and per-axis scale
struct MeshPose {
    Vec3 position{0.0f, 0.0f, 0.0f};
    Vec3 rotation{0.0f, 0.0f, 0.0f};
    Vec3 scale{1.0f, 1.0f, 1.0f};
};

/// Raycasting utilities
class Raycast {
public:
    /// Slab test against a box. The direction need not be normalized; the
    /// result is in units of the direction's parameter.
    /// Returns the entry distance, or a negative value on a miss.
    static float raycastAABB(const Vec3& origin, const Vec3& direction, const Bounds3& box,
                             float maxDistance = std::numeric_limits<float>::max());

    /// Möller–Trumbore ray/triangle intersection, two-sided.
    /// Returns the distance along the ray, or a negative value on a miss.
    static float raycastTriangle(const Vec3& origin, const Vec3& direction,
                                 const Vec3& a, const Vec3& b, const Vec3& c);

    /// Closest intersection of a ray with a posed mesh within maxDistance.
    /// The mesh bounds are tested first; triangles only when the box is hit.
    static RaycastHit raycastMesh(const Ray& ray, const MeshGeometry& mesh, const MeshPose& pose,
                                  float maxDistance);

    static Vec3 rotate(const Vec3& v, const Vec3& euler);
    static Vec3 inverseRotate(const Vec3& v, const Vec3& euler);
};

} // namespace spectral
