// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstdint>
#include <span>

#include <glm/glm.hpp>

#include "hyperray/shared/scene_view.h"

namespace hyperray::kernel {

/// Initial PRNG state of a pixel
uint32_t PixelSeed(const glm::uvec2& pixel, const glm::uvec2& extent);

/**
 * Final color of one pixel: the average of `sample_count` path samples,
 * clamped to [0, 1], alpha 1. Pure function of its inputs.
 */
glm::vec4 ShadePixel(const glm::uvec2& pixel, const shared::FrameDesc& frame);

/**
 * Per-pixel kernel entry point. Writes ShadePixel into the row-major
 * `output` (render_extent.x * render_extent.y texels). Pixels outside the
 * extent return without touching `output`.
 */
void RayTrace(const glm::uvec2& pixel, const shared::FrameDesc& frame, std::span<glm::vec4> output);

} // namespace hyperray::kernel
