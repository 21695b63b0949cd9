#pragma once

#include "engine/Vec3.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace spectral {

/// Axis-aligned bounding box in mesh-local space
struct Bounds3 {
    Vec3 min{0.0f, 0.0f, 0.0f};
    Vec3 max{0.0f, 0.0f, 0.0f};

    Vec3 center() const { return (min + max) * 0.5f; }
    Vec3 extents() const { return (max - min) * 0.5f; }
};

/// Indexed triangle mesh used both for drawing and for hit rays.
struct MeshGeometry {
    std::string name;
    std::vector<Vec3> vertices;
    std::vector<uint32_t> indices;   ///< Three per triangle
    Bounds3 bounds;

    size_t triangleCount() const { return indices.size() / 3; }
    bool empty() const { return indices.size() < 3 || vertices.empty(); }

    /// Recompute bounds from the vertex list
    void computeBounds();

    /// Procedural stand-in for the drone model: an octahedron core with
    /// four swept fins, unit-sized (fits a radius of 1.0).
    static std::shared_ptr<const MeshGeometry> makePlaceholderDrone();

    /// Regular octahedron with the given circumradius
    static std::shared_ptr<const MeshGeometry> makeOctahedron(float radius);

    /// Axis-aligned box centred on the origin
    static std::shared_ptr<const MeshGeometry> makeBox(const Vec3& halfExtents);
};

/// Source of rendered assets. Implementations may fail by returning
/// nullptr or throwing; callers fall back to procedural geometry.
class IAssetLoader {
public:
    virtual ~IAssetLoader() = default;

    virtual std::shared_ptr<const MeshGeometry> loadMesh(const std::string& path) = 0;
};

/// Loader for headless runs: there are no assets to load.
class NullAssetLoader : public IAssetLoader {
public:
    std::shared_ptr<const MeshGeometry> loadMesh(const std::string&) override { return nullptr; }
};

} // namespace spectral
