// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "hyperray/kernel/camera_ray.h"

#include <cmath>

namespace hyperray::kernel {

glm::vec2 PixelToScreen(const glm::uvec2& pixel, const glm::uvec2& extent) {
    const glm::vec2 size = glm::vec2(extent);
    glm::vec2 uv = glm::vec2(pixel) / size;
    uv.y = 1.0f - uv.y;
    uv = uv * 2.0f - 1.0f;
    uv.x *= size.x / size.y;
    return uv;
}

shared::Ray GenerateCameraRay(const glm::uvec2& pixel, const glm::uvec2& extent, const shared::Camera& camera) {
    const glm::vec2 screen = PixelToScreen(pixel, extent) * std::tan(camera.fov * 0.5f);

    shared::Ray ray;
    ray.origin = camera.position;
    ray.direction = glm::normalize(camera.right * screen.x + camera.up * screen.y + camera.forward);
    return ray;
}

} // namespace hyperray::kernel
