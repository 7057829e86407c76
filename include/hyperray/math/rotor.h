// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <glm/glm.hpp>

#include "hyperray/math/bivector.h"

namespace hyperray::math {

/**
 * Rotation in 4D expressed as scalar + bivector.
 *
 * Only simple rotors (a single rotation plane, as built by FromAnglePlane and
 * FromRotationBetween) are represented; compound orientations are applied as
 * a sequence of simple rotors.
 */
struct Rotor4 {
    float s = 1.0f;
    BiVector4 bv{};

    static Rotor4 Identity() { return Rotor4{}; }

    /// Rotation that carries unit vector `from` onto unit vector `to`
    static Rotor4 FromRotationBetween(const glm::vec4& from, const glm::vec4& to);

    /// Rotation by `angle` radians in `plane`
    static Rotor4 FromAnglePlane(float angle, const BiVector4& plane);

    float SqrLength() const { return s * s + bv.SqrLength(); }
    float Length() const;
    Rotor4 Normalized() const;

    /// Inverse rotation
    Rotor4 Reverse() const { return Rotor4{s, -bv}; }

    glm::vec4 RotateVec(const glm::vec4& v) const;
};

} // namespace hyperray::math
