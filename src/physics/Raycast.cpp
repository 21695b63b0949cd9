#include "physics/Raycast.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace spectral {

namespace {

constexpr float kEpsilon = 1e-8f;

Vec3 rotateX(const Vec3& v, float a) {
    float c = std::cos(a), s = std::sin(a);
    return {v.x, v.y * c - v.z * s, v.y * s + v.z * c};
}

Vec3 rotateY(const Vec3& v, float a) {
    float c = std::cos(a), s = std::sin(a);
    return {v.x * c + v.z * s, v.y, -v.x * s + v.z * c};
}

Vec3 rotateZ(const Vec3& v, float a) {
    float c = std::cos(a), s = std::sin(a);
    return {v.x * c - v.y * s, v.x * s + v.y * c, v.z};
}

float safeDiv(float v, float s) {
    return std::fabs(s) > kEpsilon ? v / s : v;
}

} // namespace

float Raycast::raycastAABB(const Vec3& origin, const Vec3& direction, const Bounds3& box,
                           float maxDistance) {
    float tMin = 0.0f;
    float tMax = maxDistance;

    const float o[3] = {origin.x, origin.y, origin.z};
    const float d[3] = {direction.x, direction.y, direction.z};
    const float lo[3] = {box.min.x, box.min.y, box.min.z};
    const float hi[3] = {box.max.x, box.max.y, box.max.z};

    for (int axis = 0; axis < 3; ++axis) {
        if (std::fabs(d[axis]) < kEpsilon) {
            // Ray parallel to slab
            if (o[axis] < lo[axis] || o[axis] > hi[axis]) {
                return -1.0f;
            }
            continue;
        }
        float invD = 1.0f / d[axis];
        float t1 = (lo[axis] - o[axis]) * invD;
        float t2 = (hi[axis] - o[axis]) * invD;
        if (t1 > t2) std::swap(t1, t2);

        tMin = std::max(tMin, t1);
        tMax = std::min(tMax, t2);
        if (tMin > tMax) return -1.0f;
    }
    return tMin;
}

float Raycast::raycastTriangle(const Vec3& origin, const Vec3& direction,
                               const Vec3& a, const Vec3& b, const Vec3& c) {
    Vec3 edge1 = b - a;
    Vec3 edge2 = c - a;
    Vec3 p = Vec3::cross(direction, edge2);
    float det = Vec3::dot(edge1, p);
    if (std::fabs(det) < kEpsilon) {
        return -1.0f;
    }

    float invDet = 1.0f / det;
    Vec3 s = origin - a;
    float u = Vec3::dot(s, p) * invDet;
    if (u < 0.0f || u > 1.0f) return -1.0f;

    Vec3 q = Vec3::cross(s, edge1);
    float v = Vec3::dot(direction, q) * invDet;
    if (v < 0.0f || u + v > 1.0f) return -1.0f;

    float t = Vec3::dot(edge2, q) * invDet;
    return t >= 0.0f ? t : -1.0f;
}

RaycastHit Raycast::raycastMesh(const Ray& ray, const MeshGeometry& mesh, const MeshPose& pose,
                                float maxDistance) {
    RaycastHit result;
    if (mesh.empty() || maxDistance <= 0.0f) {
        return result;
    }

    // Bring the ray into mesh-local space. The local direction is left
    // unnormalized so distances stay in world units.
    Vec3 localOrigin = inverseRotate(ray.origin - pose.position, pose.rotation);
    localOrigin = {safeDiv(localOrigin.x, pose.scale.x),
                   safeDiv(localOrigin.y, pose.scale.y),
                   safeDiv(localOrigin.z, pose.scale.z)};
    Vec3 localDir = inverseRotate(ray.direction, pose.rotation);
    localDir = {safeDiv(localDir.x, pose.scale.x),
                safeDiv(localDir.y, pose.scale.y),
                safeDiv(localDir.z, pose.scale.z)};

    if (raycastAABB(localOrigin, localDir, mesh.bounds, maxDistance) < 0.0f) {
        return result;
    }

    float closest = maxDistance;
    const size_t triangles = mesh.triangleCount();
    for (size_t i = 0; i < triangles; ++i) {
        uint32_t ia = mesh.indices[i * 3];
        uint32_t ib = mesh.indices[i * 3 + 1];
        uint32_t ic = mesh.indices[i * 3 + 2];
        if (ia >= mesh.vertices.size() || ib >= mesh.vertices.size() || ic >= mesh.vertices.size()) {
            continue;
        }
        float t = raycastTriangle(localOrigin, localDir,
                                  mesh.vertices[ia], mesh.vertices[ib], mesh.vertices[ic]);
        if (t >= 0.0f && t <= closest) {
            closest = t;
            result.hit = true;
            result.distance = t;
            result.triangle = i;
        }
    }

    if (result.hit) {
        result.point = ray.getPoint(result.distance);
    }
    return result;
}

Vec3 Raycast::rotate(const Vec3& v, const Vec3& euler) {
    return rotateZ(rotateY(rotateX(v, euler.x), euler.y), euler.z);
}

Vec3 Raycast::inverseRotate(const Vec3& v, const Vec3& euler) {
    return rotateX(rotateY(rotateZ(v, -euler.z), -euler.y), -euler.x);
}

} // namespace spectral
