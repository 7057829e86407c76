// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <array>
#include <cstdint>

#include <glm/glm.hpp>

#include "hyperray/math/rotor.h"
#include "hyperray/shared/camera.h"

namespace hyperray::renderer {

// Units per second along the camera basis
constexpr float CAMERA_SPEED = 3.0f;
// Radians per second
constexpr float CAMERA_ROTATION_SPEED = 1.5f * 1.5707964f;

struct CameraBasis {
    glm::vec4 forward;
    glm::vec4 right;
    glm::vec4 up;
};

/**
 * Host-side camera described by a position and four rotation angles.
 *
 * `pitch` turns in the ZY plane, `yaw` in the ZX plane, `weird_pitch` in the
 * ZW plane and `weird_yaw` in the XW plane. The kernel only ever sees the
 * orthonormal basis derived from them.
 */
class CameraRig {
public:
    glm::vec4 position{0.0f, 1.0f, -3.0f, 0.0f};
    float pitch = 0.0f;
    float yaw = 0.0f;
    float weird_pitch = 0.0f;
    float weird_yaw = 0.0f;
    float fov = 1.5707964f;
    float min_distance = 0.01f;
    float max_distance = 1000.0f;
    uint32_t bounce_count = 5;
    uint32_t sample_count = 1;

    /// Rotations in application order (innermost first)
    std::array<math::Rotor4, 4> Rotations() const;

    glm::vec4 Rotate(const glm::vec4& v) const;

    CameraBasis CalcBasis() const;

    shared::Camera ToKernelCamera() const;

    /// Translates along (right, up, forward) scaled by CAMERA_SPEED * dt
    void Move(const glm::vec3& localDirection, float dt);

    /// Turns by the given per-axis input scaled by CAMERA_ROTATION_SPEED * dt
    void Turn(float pitchInput, float yawInput, float weirdPitchInput, float weirdYawInput, float dt);

    /// Clamps distances and counts to usable values and wraps the angles
    void Sanitize();
};

/// Wraps an angle into [0, 2*pi)
float WrapAngle(float angle);

} // namespace hyperray::renderer
