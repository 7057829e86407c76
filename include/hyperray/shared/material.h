// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <glm/glm.hpp>

namespace hyperray::shared {

struct Material {
    glm::vec3 base_color{0.9f};
    glm::vec3 emissive_color{0.0f};
    float emission_strength = 0.0f;
};

} // namespace hyperray::shared
