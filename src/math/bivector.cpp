// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "hyperray/math/bivector.h"

#include <cmath>

namespace hyperray::math {

const BiVector4 BiVector4::Zero{};
const BiVector4 BiVector4::XY{1.0f, 0.0f, 0.0f, 0.0f, 0.0f, 0.0f};
const BiVector4 BiVector4::XZ{0.0f, 1.0f, 0.0f, 0.0f, 0.0f, 0.0f};
const BiVector4 BiVector4::XW{0.0f, 0.0f, 1.0f, 0.0f, 0.0f, 0.0f};
const BiVector4 BiVector4::YX{-1.0f, 0.0f, 0.0f, 0.0f, 0.0f, 0.0f};
const BiVector4 BiVector4::YZ{0.0f, 0.0f, 0.0f, 1.0f, 0.0f, 0.0f};
const BiVector4 BiVector4::YW{0.0f, 0.0f, 0.0f, 0.0f, 1.0f, 0.0f};
const BiVector4 BiVector4::ZX{0.0f, -1.0f, 0.0f, 0.0f, 0.0f, 0.0f};
const BiVector4 BiVector4::ZY{0.0f, 0.0f, 0.0f, -1.0f, 0.0f, 0.0f};
const BiVector4 BiVector4::ZW{0.0f, 0.0f, 0.0f, 0.0f, 0.0f, 1.0f};
const BiVector4 BiVector4::WX{0.0f, 0.0f, -1.0f, 0.0f, 0.0f, 0.0f};
const BiVector4 BiVector4::WY{0.0f, 0.0f, 0.0f, 0.0f, -1.0f, 0.0f};
const BiVector4 BiVector4::WZ{0.0f, 0.0f, 0.0f, 0.0f, 0.0f, -1.0f};

float BiVector4::SqrLength() const {
    return xy * xy + xz * xz + xw * xw + yz * yz + yw * yw + zw * zw;
}

float BiVector4::Length() const {
    return std::sqrt(SqrLength());
}

BiVector4 BiVector4::Normalized() const {
    return *this * (1.0f / Length());
}

BiVector4 Wedge(const glm::vec4& a, const glm::vec4& b) {
    return BiVector4{
        (a.x * b.y) - (b.x * a.y),
        (a.x * b.z) - (b.x * a.z),
        (a.x * b.w) - (b.x * a.w),
        (a.y * b.z) - (b.y * a.z),
        (a.y * b.w) - (b.y * a.w),
        (a.z * b.w) - (b.z * a.w),
    };
}

} // namespace hyperray::math
