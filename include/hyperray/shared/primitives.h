// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstdint>
#include <glm/glm.hpp>

namespace hyperray::shared {

/// Points at distance `radius` from `center` in 4D
struct HyperSphere {
    glm::vec4 center{0.0f};
    float radius = 1.0f;
    uint32_t material = 0;
};

/// Axis-aligned 4D box
struct HyperCuboid {
    glm::vec4 center{0.0f};
    glm::vec4 half_extents{0.5f};
    uint32_t material = 0;
};

/// 3D subspace through `point` orthogonal to unit `normal`
struct HyperPlane {
    glm::vec4 point{0.0f};
    glm::vec4 normal{0.0f, 1.0f, 0.0f, 0.0f};
    uint32_t material = 0;
};

} // namespace hyperray::shared
