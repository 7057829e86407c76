// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

namespace hyperray::kernel {

// Largest float below 1.0
constexpr float ONE_MINUS_EPSILON = 0x1.fffffep-1f;

/**
 * Advances `state` one PCG step and returns a uniform value in [0, 1).
 * The state is owned by the caller; identical seeds and call orders
 * reproduce identical sequences.
 */
inline float NextUniform(uint32_t& state) {
    state = state * 747796405u + 2891336453u;
    uint32_t result = ((state >> ((state >> 28u) + 4u)) ^ state) * 277803737u;
    result = (result >> 22u) ^ result;
    const float value = static_cast<float>(static_cast<double>(result) / 4294967295.0);
    return value < 1.0f ? value : ONE_MINUS_EPSILON;
}

/// Standard normal sample via Box-Muller
inline float NextNormal(uint32_t& state) {
    const float theta = glm::two_pi<float>() * NextUniform(state);
    // log(0) is -inf; a zero draw must not escape as an infinite sample
    const float u = std::max(NextUniform(state), std::numeric_limits<float>::min());
    const float rho = std::sqrt(-2.0f * std::log(u));
    return rho * std::cos(theta);
}

/// Direction uniformly distributed over the 4D unit hypersphere
inline glm::vec4 NextDirection4(uint32_t& state) {
    const float x = NextNormal(state);
    const float y = NextNormal(state);
    const float z = NextNormal(state);
    const float w = NextNormal(state);
    return glm::normalize(glm::vec4(x, y, z, w));
}

/// Uniform (not cosine-weighted) direction in the hemisphere around `normal`
inline glm::vec4 NextHemisphereDirection4(uint32_t& state, const glm::vec4& normal) {
    const glm::vec4 direction = NextDirection4(state);
    return glm::dot(direction, normal) < 0.0f ? -direction : direction;
}

} // namespace hyperray::kernel
