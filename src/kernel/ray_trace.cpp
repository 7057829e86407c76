// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "hyperray/kernel/ray_trace.h"

#include <algorithm>

#include "hyperray/kernel/camera_ray.h"
#include "hyperray/kernel/path_trace.h"

namespace hyperray::kernel {

uint32_t PixelSeed(const glm::uvec2& pixel, const glm::uvec2& extent) {
    return pixel.y * extent.x + pixel.x;
}

glm::vec4 ShadePixel(const glm::uvec2& pixel, const shared::FrameDesc& frame) {
    const shared::Camera& camera = frame.camera;
    const shared::Ray ray = GenerateCameraRay(pixel, frame.render_extent, camera);

    uint32_t rng = PixelSeed(pixel, frame.render_extent);
    const uint32_t sampleCount = std::max(camera.sample_count, 1u);

    glm::vec3 color(0.0f);
    for (uint32_t sample = 0; sample < sampleCount; ++sample) {
        color += TracePath(ray, rng, camera, frame.scene);
    }
    color /= static_cast<float>(sampleCount);

    return glm::vec4(glm::clamp(color, glm::vec3(0.0f), glm::vec3(1.0f)), 1.0f);
}

void RayTrace(const glm::uvec2& pixel, const shared::FrameDesc& frame, std::span<glm::vec4> output) {
    if (pixel.x >= frame.render_extent.x || pixel.y >= frame.render_extent.y) {
        return;
    }

    const size_t index = static_cast<size_t>(pixel.y) * frame.render_extent.x + pixel.x;
    if (index >= output.size()) {
        return;
    }
    output[index] = ShadePixel(pixel, frame);
}

} // namespace hyperray::kernel
