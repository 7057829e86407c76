// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstdint>
#include <glm/glm.hpp>

namespace hyperray::shared {

struct Ray {
    glm::vec4 origin{0.0f};
    glm::vec4 direction{0.0f, 0.0f, 1.0f, 0.0f}; // unit length
};

/**
 * Closest-hit record. When `hit` is false only `distance` carries meaning,
 * and only to the scene intersector that seeded it.
 */
struct Hit {
    bool hit = false;
    float distance = 0.0f;
    glm::vec4 position{0.0f};
    glm::vec4 normal{0.0f};
    uint32_t material = 0;

    static Hit Miss(float distance) {
        Hit result;
        result.distance = distance;
        return result;
    }
};

} // namespace hyperray::shared
