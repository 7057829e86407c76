// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "hyperray/shared/primitives.h"
#include "hyperray/shared/ray.h"

namespace hyperray::kernel {

// Analytic ray-primitive tests. Each accepts only distances in
// [minDistance, maxDistance] and returns a normal facing the ray origin.

shared::Hit IntersectHyperSphere(const shared::Ray& ray, const shared::HyperSphere& sphere,
                                 float minDistance, float maxDistance);

shared::Hit IntersectHyperCuboid(const shared::Ray& ray, const shared::HyperCuboid& cuboid,
                                 float minDistance, float maxDistance);

shared::Hit IntersectHyperPlane(const shared::Ray& ray, const shared::HyperPlane& plane,
                                float minDistance, float maxDistance);

} // namespace hyperray::kernel
