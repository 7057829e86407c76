// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "hyperray/math/rotor.h"

#include <cmath>

namespace hyperray::math {

Rotor4 Rotor4::FromRotationBetween(const glm::vec4& from, const glm::vec4& to) {
    return Rotor4{1.0f + glm::dot(to, from), Wedge(to, from)}.Normalized();
}

Rotor4 Rotor4::FromAnglePlane(float angle, const BiVector4& plane) {
    const float halfAngle = angle * 0.5f;
    const float sin = std::sin(halfAngle);
    const float cos = std::cos(halfAngle);
    return Rotor4{cos, plane * -sin}.Normalized();
}

float Rotor4::Length() const {
    return std::sqrt(SqrLength());
}

Rotor4 Rotor4::Normalized() const {
    const float inv = 1.0f / Length();
    return Rotor4{s * inv, bv * inv};
}

glm::vec4 Rotor4::RotateVec(const glm::vec4& v) const {
    // q = R v
    const float x = s * v.x + bv.xy * v.y + bv.xz * v.z + bv.xw * v.w;
    const float y = s * v.y - bv.xy * v.x + bv.yz * v.z + bv.yw * v.w;
    const float z = s * v.z - bv.xz * v.x - bv.yz * v.y + bv.zw * v.w;
    const float w = s * v.w - bv.xw * v.x - bv.yw * v.y - bv.zw * v.z;

    const float xyz = bv.xy * v.z - bv.xz * v.y + bv.yz * v.x;
    const float yzw = bv.yz * v.w - bv.yw * v.z + bv.zw * v.y;
    const float zwx = bv.xz * v.w - bv.xw * v.z + bv.zw * v.x;
    const float wxy = bv.xy * v.w - bv.xw * v.y + bv.yw * v.x;

    // q R~
    const Rotor4 p = Reverse();
    return glm::vec4(
        x * p.s - y * p.bv.xy - z * p.bv.xz - w * p.bv.xw - xyz * p.bv.yz - wxy * p.bv.yw - zwx * p.bv.zw,
        y * p.s + x * p.bv.xy - z * p.bv.yz - w * p.bv.yw + xyz * p.bv.xz + wxy * p.bv.xw - yzw * p.bv.zw,
        z * p.s + x * p.bv.xz + y * p.bv.yz - w * p.bv.zw - xyz * p.bv.xy + zwx * p.bv.xw + yzw * p.bv.yw,
        w * p.s + x * p.bv.xw + y * p.bv.yw + z * p.bv.zw - wxy * p.bv.xy - zwx * p.bv.xz - yzw * p.bv.yz);
}

} // namespace hyperray::math
