// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "hyperray/kernel/intersect.h"

#include <cmath>
#include <limits>
#include <utility>

namespace hyperray::kernel {

namespace {

bool InRange(float t, float minDistance, float maxDistance) {
    return t >= minDistance && t <= maxDistance;
}

// Flips `normal` so it faces back toward the ray origin
glm::vec4 FaceTowardOrigin(const glm::vec4& normal, const glm::vec4& position, const glm::vec4& origin) {
    return glm::dot(normal, origin - position) < 0.0f ? -normal : normal;
}

} // namespace

shared::Hit IntersectHyperSphere(const shared::Ray& ray, const shared::HyperSphere& sphere,
                                 float minDistance, float maxDistance) {
    const glm::vec4 oc = ray.origin - sphere.center;
    const float a = glm::dot(ray.direction, ray.direction);
    const float halfB = glm::dot(oc, ray.direction);
    const float c = glm::dot(oc, oc) - sphere.radius * sphere.radius;

    const float discriminant = halfB * halfB - a * c;
    if (discriminant < 0.0f) {
        return shared::Hit{};
    }

    // Each root is checked on its own so a ray starting inside the sphere
    // still finds the far wall.
    const float sqrtD = std::sqrt(discriminant);
    const float nearRoot = (-halfB - sqrtD) / a;
    const float farRoot = (-halfB + sqrtD) / a;

    float distance;
    if (InRange(nearRoot, minDistance, maxDistance)) {
        distance = nearRoot;
    } else if (InRange(farRoot, minDistance, maxDistance)) {
        distance = farRoot;
    } else {
        return shared::Hit{};
    }

    shared::Hit hit;
    hit.hit = true;
    hit.distance = distance;
    hit.position = ray.origin + ray.direction * distance;
    hit.normal = FaceTowardOrigin(glm::normalize(hit.position - sphere.center), hit.position, ray.origin);
    hit.material = sphere.material;
    return hit;
}

shared::Hit IntersectHyperCuboid(const shared::Ray& ray, const shared::HyperCuboid& cuboid,
                                 float minDistance, float maxDistance) {
    const glm::vec4 boxMin = cuboid.center - cuboid.half_extents;
    const glm::vec4 boxMax = cuboid.center + cuboid.half_extents;

    float tNear = -std::numeric_limits<float>::infinity();
    float tFar = std::numeric_limits<float>::infinity();
    int nearAxis = -1;
    int farAxis = -1;

    for (int axis = 0; axis < 4; ++axis) {
        const float origin = ray.origin[axis];
        const float direction = ray.direction[axis];

        if (direction == 0.0f) {
            // Parallel to this slab
            if (origin < boxMin[axis] || origin > boxMax[axis]) {
                return shared::Hit{};
            }
            continue;
        }

        const float invDirection = 1.0f / direction;
        float t0 = (boxMin[axis] - origin) * invDirection;
        float t1 = (boxMax[axis] - origin) * invDirection;
        if (t0 > t1) {
            std::swap(t0, t1);
        }

        if (t0 > tNear) {
            tNear = t0;
            nearAxis = axis;
        }
        if (t1 < tFar) {
            tFar = t1;
            farAxis = axis;
        }
    }

    if (tNear > tFar) {
        return shared::Hit{};
    }

    // Entry point first, exit point when the origin is inside (or the entry is too close)
    float distance;
    int axis;
    if (nearAxis >= 0 && InRange(tNear, minDistance, maxDistance)) {
        distance = tNear;
        axis = nearAxis;
    } else if (farAxis >= 0 && InRange(tFar, minDistance, maxDistance)) {
        distance = tFar;
        axis = farAxis;
    } else {
        return shared::Hit{};
    }

    shared::Hit hit;
    hit.hit = true;
    hit.distance = distance;
    hit.position = ray.origin + ray.direction * distance;
    hit.normal = glm::vec4(0.0f);
    hit.normal[axis] = ray.direction[axis] > 0.0f ? -1.0f : 1.0f;
    hit.material = cuboid.material;
    return hit;
}

shared::Hit IntersectHyperPlane(const shared::Ray& ray, const shared::HyperPlane& plane,
                                float minDistance, float maxDistance) {
    const float denom = glm::dot(plane.normal, ray.direction);
    if (std::abs(denom) < 1e-6f) {
        return shared::Hit{};
    }

    const float distance = glm::dot(plane.point - ray.origin, plane.normal) / denom;
    if (!InRange(distance, minDistance, maxDistance)) {
        return shared::Hit{};
    }

    shared::Hit hit;
    hit.hit = true;
    hit.distance = distance;
    hit.position = ray.origin + ray.direction * distance;
    hit.normal = FaceTowardOrigin(plane.normal, hit.position, ray.origin);
    hit.material = plane.material;
    return hit;
}

} // namespace hyperray::kernel
