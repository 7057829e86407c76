// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "hyperray/shared/ray.h"
#include "hyperray/shared/scene_view.h"

namespace hyperray::kernel {

/**
 * Nearest hit over every primitive, scanning hyperspheres, hypercuboids and
 * then hyperplanes. A later primitive replaces the current best only when it
 * is strictly closer. Cost is linear in the primitive count.
 */
shared::Hit IntersectScene(const shared::Ray& ray, const shared::SceneView& scene,
                           float minDistance, float maxDistance);

} // namespace hyperray::kernel
