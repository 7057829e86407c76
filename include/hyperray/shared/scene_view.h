// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <span>

#include <glm/glm.hpp>

#include "hyperray/shared/camera.h"
#include "hyperray/shared/material.h"
#include "hyperray/shared/primitives.h"

namespace hyperray::shared {

struct SkyColors {
    glm::vec3 down{1.0f, 1.0f, 1.0f};
    glm::vec3 up{0.5f, 0.7f, 1.0f};
};

/**
 * Read-only frame inputs for the kernel. Every `material` index referenced by
 * a primitive must be valid for `materials`; the host enforces this.
 */
struct SceneView {
    std::span<const HyperSphere> hyper_spheres;
    std::span<const HyperCuboid> hyper_cuboids;
    std::span<const HyperPlane> hyper_planes;
    std::span<const Material> materials;
    SkyColors sky;
};

/// Everything one kernel invocation reads
struct FrameDesc {
    Camera camera;
    SceneView scene;
    glm::uvec2 render_extent{0u};
};

} // namespace hyperray::shared
