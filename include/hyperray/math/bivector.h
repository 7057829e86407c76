// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <glm/glm.hpp>

namespace hyperray::math {

/**
 * Oriented plane element of 4D space, one component per coordinate plane.
 */
struct BiVector4 {
    float xy = 0.0f;
    float xz = 0.0f;
    float xw = 0.0f;
    float yz = 0.0f;
    float yw = 0.0f;
    float zw = 0.0f;

    static const BiVector4 Zero;
    static const BiVector4 XY;
    static const BiVector4 XZ;
    static const BiVector4 XW;
    static const BiVector4 YX;
    static const BiVector4 YZ;
    static const BiVector4 YW;
    static const BiVector4 ZX;
    static const BiVector4 ZY;
    static const BiVector4 ZW;
    static const BiVector4 WX;
    static const BiVector4 WY;
    static const BiVector4 WZ;

    float SqrLength() const;
    float Length() const;
    BiVector4 Normalized() const;

    BiVector4 operator-() const { return {-xy, -xz, -xw, -yz, -yw, -zw}; }
    BiVector4 operator*(float s) const { return {xy * s, xz * s, xw * s, yz * s, yw * s, zw * s}; }

    bool operator==(const BiVector4& other) const = default;
};

/// Outer product a ^ b
BiVector4 Wedge(const glm::vec4& a, const glm::vec4& b);

} // namespace hyperray::math
