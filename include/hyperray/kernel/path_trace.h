// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstdint>

#include <glm/glm.hpp>

#include "hyperray/shared/camera.h"
#include "hyperray/shared/ray.h"
#include "hyperray/shared/scene_view.h"

namespace hyperray::kernel {

/// Background radiance, blended from `sky.down` to `sky.up` by the direction's y
glm::vec3 SkyGradient(const glm::vec4& direction, const shared::SkyColors& sky);

/**
 * One Monte Carlo sample of the radiance arriving along `ray`.
 *
 * Runs at most `camera.bounce_count` bounces and stops at the first miss.
 * Bounces scatter along normalize(normal + uniform 4D direction) drawn from
 * `rng`; there is no Russian roulette.
 */
glm::vec3 TracePath(shared::Ray ray, uint32_t& rng, const shared::Camera& camera,
                    const shared::SceneView& scene);

} // namespace hyperray::kernel
