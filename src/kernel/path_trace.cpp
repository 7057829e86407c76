// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "hyperray/kernel/path_trace.h"

#include "hyperray/kernel/random.h"
#include "hyperray/kernel/scene_intersect.h"

namespace hyperray::kernel {

glm::vec3 SkyGradient(const glm::vec4& direction, const shared::SkyColors& sky) {
    const float t = direction.y * 0.5f + 0.5f;
    return glm::mix(sky.down, sky.up, t);
}

glm::vec3 TracePath(shared::Ray ray, uint32_t& rng, const shared::Camera& camera,
                    const shared::SceneView& scene) {
    glm::vec3 incomingLight(0.0f);
    glm::vec3 throughput(1.0f);

    for (uint32_t bounce = 0; bounce < camera.bounce_count; ++bounce) {
        const shared::Hit hit = IntersectScene(ray, scene, camera.min_distance, camera.max_distance);
        if (!hit.hit) {
            incomingLight += throughput * SkyGradient(ray.direction, scene.sky);
            break;
        }

        const shared::Material& material = scene.materials[hit.material];
        incomingLight += throughput * material.emissive_color * material.emission_strength;
        throughput *= material.base_color;

        ray.origin = hit.position + hit.normal * camera.min_distance;
        ray.direction = glm::normalize(hit.normal + NextDirection4(rng));
    }

    return incomingLight;
}

} // namespace hyperray::kernel
