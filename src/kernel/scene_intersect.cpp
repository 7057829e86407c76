// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "hyperray/kernel/scene_intersect.h"

#include "hyperray/kernel/intersect.h"

namespace hyperray::kernel {

shared::Hit IntersectScene(const shared::Ray& ray, const shared::SceneView& scene,
                           float minDistance, float maxDistance) {
    shared::Hit closest = shared::Hit::Miss(maxDistance);

    auto consider = [&closest](const shared::Hit& hit) {
        if (hit.hit && hit.distance < closest.distance) {
            closest = hit;
        }
    };

    for (const auto& sphere : scene.hyper_spheres) {
        consider(IntersectHyperSphere(ray, sphere, minDistance, maxDistance));
    }
    for (const auto& cuboid : scene.hyper_cuboids) {
        consider(IntersectHyperCuboid(ray, cuboid, minDistance, maxDistance));
    }
    for (const auto& plane : scene.hyper_planes) {
        consider(IntersectHyperPlane(ray, plane, minDistance, maxDistance));
    }

    return closest;
}

} // namespace hyperray::kernel
