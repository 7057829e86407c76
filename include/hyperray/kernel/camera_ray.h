// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <glm/glm.hpp>

#include "hyperray/shared/camera.h"
#include "hyperray/shared/ray.h"

namespace hyperray::kernel {

/// Pixel coordinate to [-1, 1] screen coordinates, +y up, x scaled by aspect ratio
glm::vec2 PixelToScreen(const glm::uvec2& pixel, const glm::uvec2& extent);

/**
 * Primary ray through `pixel`. The direction is normalized; the origin is
 * the camera position.
 */
shared::Ray GenerateCameraRay(const glm::uvec2& pixel, const glm::uvec2& extent, const shared::Camera& camera);

} // namespace hyperray::kernel
