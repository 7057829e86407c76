// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "hyperray/renderer/camera_rig.h"

#include <algorithm>
#include <cmath>

#include <glm/gtc/constants.hpp>

namespace hyperray::renderer {

float WrapAngle(float angle) {
    const float tau = glm::two_pi<float>();
    float wrapped = std::fmod(angle, tau);
    wrapped = std::fmod(wrapped + tau, tau);
    return wrapped < tau ? wrapped : 0.0f;
}

std::array<math::Rotor4, 4> CameraRig::Rotations() const {
    return {
        math::Rotor4::FromAnglePlane(weird_pitch, math::BiVector4::ZW),
        math::Rotor4::FromAnglePlane(weird_yaw, math::BiVector4::XW),
        math::Rotor4::FromAnglePlane(pitch, math::BiVector4::ZY),
        math::Rotor4::FromAnglePlane(yaw, math::BiVector4::ZX),
    };
}

glm::vec4 CameraRig::Rotate(const glm::vec4& v) const {
    glm::vec4 result = v;
    for (const auto& rotor : Rotations()) {
        result = rotor.RotateVec(result);
    }
    return result;
}

CameraBasis CameraRig::CalcBasis() const {
    return CameraBasis{
        Rotate(glm::vec4(0.0f, 0.0f, 1.0f, 0.0f)),
        Rotate(glm::vec4(1.0f, 0.0f, 0.0f, 0.0f)),
        Rotate(glm::vec4(0.0f, 1.0f, 0.0f, 0.0f)),
    };
}

shared::Camera CameraRig::ToKernelCamera() const {
    const CameraBasis basis = CalcBasis();

    shared::Camera camera;
    camera.position = position;
    camera.forward = basis.forward;
    camera.right = basis.right;
    camera.up = basis.up;
    camera.fov = fov;
    camera.min_distance = min_distance;
    camera.max_distance = max_distance;
    camera.bounce_count = bounce_count;
    camera.sample_count = sample_count;
    return camera;
}

void CameraRig::Move(const glm::vec3& localDirection, float dt) {
    const CameraBasis basis = CalcBasis();
    const glm::vec4 offset = basis.right * localDirection.x + basis.up * localDirection.y + basis.forward * localDirection.z;
    position += offset * (CAMERA_SPEED * dt);
}

void CameraRig::Turn(float pitchInput, float yawInput, float weirdPitchInput, float weirdYawInput, float dt) {
    const float step = CAMERA_ROTATION_SPEED * dt;
    pitch = WrapAngle(pitch + pitchInput * step);
    yaw = WrapAngle(yaw + yawInput * step);
    weird_pitch = WrapAngle(weird_pitch + weirdPitchInput * step);
    weird_yaw = WrapAngle(weird_yaw + weirdYawInput * step);
}

void CameraRig::Sanitize() {
    fov = WrapAngle(fov);
    pitch = WrapAngle(pitch);
    yaw = WrapAngle(yaw);
    weird_pitch = WrapAngle(weird_pitch);
    weird_yaw = WrapAngle(weird_yaw);
    min_distance = std::max(min_distance, 0.0f);
    max_distance = std::max(max_distance, min_distance);
    bounce_count = std::max(bounce_count, 1u);
    sample_count = std::max(sample_count, 1u);
}

} // namespace hyperray::renderer
