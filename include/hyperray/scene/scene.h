// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "hyperray/core/result.h"
#include "hyperray/renderer/camera_rig.h"
#include "hyperray/shared/material.h"
#include "hyperray/shared/primitives.h"
#include "hyperray/shared/scene_view.h"

namespace hyperray::scene {

/**
 * Host-side scene: packed primitive and material arrays ready for the kernel,
 * display names kept alongside each primitive array, sky colors and camera.
 */
class Scene {
public:
    /// Orange hypersphere resting on a green ground hyperplane
    static Scene Default();

    renderer::CameraRig& Camera() { return camera_; }
    const renderer::CameraRig& Camera() const { return camera_; }

    shared::SkyColors& Sky() { return sky_; }
    const shared::SkyColors& Sky() const { return sky_; }

    const std::vector<shared::Material>& Materials() const { return materials_; }
    const std::vector<shared::HyperSphere>& HyperSpheres() const { return hyperSpheres_; }
    const std::vector<shared::HyperCuboid>& HyperCuboids() const { return hyperCuboids_; }
    const std::vector<shared::HyperPlane>& HyperPlanes() const { return hyperPlanes_; }

    const std::vector<std::string>& HyperSphereNames() const { return hyperSphereNames_; }
    const std::vector<std::string>& HyperCuboidNames() const { return hyperCuboidNames_; }
    const std::vector<std::string>& HyperPlaneNames() const { return hyperPlaneNames_; }

    shared::Material& MaterialAt(size_t index);

    uint32_t AddMaterial(const shared::Material& material);

    size_t AddHyperSphere(std::string name, const shared::HyperSphere& sphere);
    size_t AddHyperCuboid(std::string name, const shared::HyperCuboid& cuboid);
    size_t AddHyperPlane(std::string name, const shared::HyperPlane& plane);

    // Each Create* appends a fresh grey material owned by the new primitive
    size_t CreateHyperSphere();
    size_t CreateHyperCuboid();
    size_t CreateHyperPlane();

    void RemoveHyperSphere(size_t index);
    void RemoveHyperCuboid(size_t index);
    void RemoveHyperPlane(size_t index);

    size_t PrimitiveCount() const;

    /// Checks every precondition the kernel relies on
    core::Result<void> Validate() const;

    shared::SceneView View() const;

    /// Frame inputs for one kernel invocation; the view borrows this scene
    shared::FrameDesc MakeFrameDesc(const glm::uvec2& extent) const;

private:
    renderer::CameraRig camera_;
    shared::SkyColors sky_;
    std::vector<shared::Material> materials_;
    std::vector<shared::HyperSphere> hyperSpheres_;
    std::vector<std::string> hyperSphereNames_;
    std::vector<shared::HyperCuboid> hyperCuboids_;
    std::vector<std::string> hyperCuboidNames_;
    std::vector<shared::HyperPlane> hyperPlanes_;
    std::vector<std::string> hyperPlaneNames_;
};

} // namespace hyperray::scene
