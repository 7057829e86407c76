// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstdint>
#include <glm/glm.hpp>

namespace hyperray::shared {

/**
 * Per-frame camera record read by the kernel.
 *
 * right/up/forward are expected to be mutually orthonormal,
 * min_distance < max_distance and sample_count >= 1.
 */
struct Camera {
    glm::vec4 position{0.0f};
    glm::vec4 forward{0.0f, 0.0f, 1.0f, 0.0f};
    glm::vec4 right{1.0f, 0.0f, 0.0f, 0.0f};
    glm::vec4 up{0.0f, 1.0f, 0.0f, 0.0f};
    float fov = 1.5707964f;
    float min_distance = 0.01f;
    float max_distance = 1000.0f;
    uint32_t bounce_count = 5;
    uint32_t sample_count = 1;
};

} // namespace hyperray::shared
