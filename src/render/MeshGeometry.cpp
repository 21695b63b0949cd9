#include "render/MeshGeometry.hpp"

#include <algorithm>

namespace spectral {

void MeshGeometry::computeBounds() {
    if (vertices.empty()) {
        bounds = {};
        return;
    }
    bounds.min = vertices.front();
    bounds.max = vertices.front();
    for (const auto& v : vertices) {
        bounds.min.x = std::min(bounds.min.x, v.x);
        bounds.min.y = std::min(bounds.min.y, v.y);
        bounds.min.z = std::min(bounds.min.z, v.z);
        bounds.max.x = std::max(bounds.max.x, v.x);
        bounds.max.y = std::max(bounds.max.y, v.y);
        bounds.max.z = std::max(bounds.max.z, v.z);
    }
}

std::shared_ptr<const MeshGeometry> MeshGeometry::makeOctahedron(float radius) {
    auto mesh = std::make_shared<MeshGeometry>();
    mesh->name = "octahedron";
    mesh->vertices = {
        { radius, 0.0f, 0.0f}, {-radius, 0.0f, 0.0f},
        {0.0f,  radius, 0.0f}, {0.0f, -radius, 0.0f},
        {0.0f, 0.0f,  radius}, {0.0f, 0.0f, -radius},
    };
    mesh->indices = {
        0, 2, 4,  2, 1, 4,  1, 3, 4,  3, 0, 4,
        2, 0, 5,  1, 2, 5,  3, 1, 5,  0, 3, 5,
    };
    mesh->computeBounds();
    return mesh;
}

std::shared_ptr<const MeshGeometry> MeshGeometry::makeBox(const Vec3& h) {
    auto mesh = std::make_shared<MeshGeometry>();
    mesh->name = "box";
    mesh->vertices = {
        {-h.x, -h.y, -h.z}, { h.x, -h.y, -h.z}, { h.x,  h.y, -h.z}, {-h.x,  h.y, -h.z},
        {-h.x, -h.y,  h.z}, { h.x, -h.y,  h.z}, { h.x,  h.y,  h.z}, {-h.x,  h.y,  h.z},
    };
    mesh->indices = {
        0, 2, 1,  0, 3, 2,   // -z
        4, 5, 6,  4, 6, 7,   // +z
        0, 1, 5,  0, 5, 4,   // -y
        3, 6, 2,  3, 7, 6,   // +y
        0, 4, 7,  0, 7, 3,   // -x
        1, 2, 6,  1, 6, 5,   // +x
    };
    mesh->computeBounds();
    return mesh;
}

std::shared_ptr<const MeshGeometry> MeshGeometry::makePlaceholderDrone() {
    auto mesh = std::make_shared<MeshGeometry>();
    mesh->name = "placeholder_drone";

    // Core: octahedron of radius 0.6
    const float r = 0.6f;
    mesh->vertices = {
        { r, 0.0f, 0.0f}, {-r, 0.0f, 0.0f},
        {0.0f,  r, 0.0f}, {0.0f, -r, 0.0f},
        {0.0f, 0.0f,  r}, {0.0f, 0.0f, -r},
    };
    mesh->indices = {
        0, 2, 4,  2, 1, 4,  1, 3, 4,  3, 0, 4,
        2, 0, 5,  1, 2, 5,  3, 1, 5,  0, 3, 5,
    };

    // Fins: one thin triangle per side, swept back along -z
    const Vec3 finTips[4] = {
        { 1.0f, 0.0f, -0.4f}, {-1.0f, 0.0f, -0.4f},
        {0.0f,  1.0f, -0.4f}, {0.0f, -1.0f, -0.4f},
    };
    const uint32_t finRoots[4] = {0, 1, 2, 3};
    for (int i = 0; i < 4; ++i) {
        auto tip = static_cast<uint32_t>(mesh->vertices.size());
        mesh->vertices.push_back(finTips[i]);
        // Double-sided so hits register from either face
        mesh->indices.insert(mesh->indices.end(), {finRoots[i], tip, 5u});
        mesh->indices.insert(mesh->indices.end(), {finRoots[i], 5u, tip});
    }

    mesh->computeBounds();
    return mesh;
}

} // namespace spectral
