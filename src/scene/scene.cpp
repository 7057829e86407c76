// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "hyperray/scene/scene.h"

#include <cmath>
#include <utility>

#include <fmt/format.h>

#include "hyperray/core/error.hpp"

namespace hyperray::scene {

namespace {

template<typename T>
void EraseAt(std::vector<T>& items, std::vector<std::string>& names, size_t index, const char* kind) {
    if (index >= items.size()) {
        throw SceneError(fmt::format("{} index {} out of range ({} present)", kind, index, items.size()));
    }
    items.erase(items.begin() + static_cast<std::ptrdiff_t>(index));
    names.erase(names.begin() + static_cast<std::ptrdiff_t>(index));
}

shared::Material DefaultMaterial() {
    shared::Material material;
    material.base_color = glm::vec3(0.9f, 0.9f, 0.9f);
    material.emissive_color = glm::vec3(0.0f);
    material.emission_strength = 0.0f;
    return material;
}

} // namespace

Scene Scene::Default() {
    Scene scene;

    const uint32_t sphereMaterial = scene.AddMaterial(shared::Material{glm::vec3(0.8f, 0.4f, 0.1f), glm::vec3(0.0f), 0.0f});
    const uint32_t groundMaterial = scene.AddMaterial(shared::Material{glm::vec3(0.1f, 0.8f, 0.3f), glm::vec3(0.0f), 0.0f});

    scene.AddHyperSphere("Hyper Sphere", shared::HyperSphere{glm::vec4(0.0f, 1.0f, 0.0f, 0.0f), 1.0f, sphereMaterial});
    scene.AddHyperPlane("Ground", shared::HyperPlane{glm::vec4(0.0f), glm::vec4(0.0f, 1.0f, 0.0f, 0.0f), groundMaterial});

    return scene;
}

shared::Material& Scene::MaterialAt(size_t index) {
    if (index >= materials_.size()) {
        throw SceneError(fmt::format("material index {} out of range ({} present)", index, materials_.size()));
    }
    return materials_[index];
}

uint32_t Scene::AddMaterial(const shared::Material& material) {
    materials_.push_back(material);
    return static_cast<uint32_t>(materials_.size() - 1);
}

size_t Scene::AddHyperSphere(std::string name, const shared::HyperSphere& sphere) {
    hyperSpheres_.push_back(sphere);
    hyperSphereNames_.push_back(std::move(name));
    return hyperSpheres_.size() - 1;
}

size_t Scene::AddHyperCuboid(std::string name, const shared::HyperCuboid& cuboid) {
    hyperCuboids_.push_back(cuboid);
    hyperCuboidNames_.push_back(std::move(name));
    return hyperCuboids_.size() - 1;
}

size_t Scene::AddHyperPlane(std::string name, const shared::HyperPlane& plane) {
    hyperPlanes_.push_back(plane);
    hyperPlaneNames_.push_back(std::move(name));
    return hyperPlanes_.size() - 1;
}

size_t Scene::CreateHyperSphere() {
    shared::HyperSphere sphere;
    sphere.material = AddMaterial(DefaultMaterial());
    return AddHyperSphere("Default Hyper Sphere", sphere);
}

size_t Scene::CreateHyperCuboid() {
    shared::HyperCuboid cuboid;
    cuboid.material = AddMaterial(DefaultMaterial());
    return AddHyperCuboid("Default Hyper Cuboid", cuboid);
}

size_t Scene::CreateHyperPlane() {
    shared::HyperPlane plane;
    plane.material = AddMaterial(DefaultMaterial());
    return AddHyperPlane("Default Hyper Plane", plane);
}

void Scene::RemoveHyperSphere(size_t index) {
    EraseAt(hyperSpheres_, hyperSphereNames_, index, "hyper sphere");
}

void Scene::RemoveHyperCuboid(size_t index) {
    EraseAt(hyperCuboids_, hyperCuboidNames_, index, "hyper cuboid");
}

void Scene::RemoveHyperPlane(size_t index) {
    EraseAt(hyperPlanes_, hyperPlaneNames_, index, "hyper plane");
}

size_t Scene::PrimitiveCount() const {
    return hyperSpheres_.size() + hyperCuboids_.size() + hyperPlanes_.size();
}

core::Result<void> Scene::Validate() const {
    HYPERRAY_ENSURE(camera_.min_distance < camera_.max_distance,
                    fmt::format("camera min_distance {} must be below max_distance {}",
                                camera_.min_distance, camera_.max_distance));
    HYPERRAY_ENSURE(camera_.sample_count >= 1, "camera sample_count must be at least 1");

    for (size_t i = 0; i < materials_.size(); ++i) {
        HYPERRAY_ENSURE(materials_[i].emission_strength >= 0.0f,
                        fmt::format("material {} has negative emission strength", i));
    }

    const size_t materialCount = materials_.size();
    for (size_t i = 0; i < hyperSpheres_.size(); ++i) {
        const auto& sphere = hyperSpheres_[i];
        HYPERRAY_ENSURE(sphere.radius > 0.0f,
                        fmt::format("hyper sphere '{}' has non-positive radius {}", hyperSphereNames_[i], sphere.radius));
        HYPERRAY_ENSURE(sphere.material < materialCount,
                        fmt::format("hyper sphere '{}' references missing material {}", hyperSphereNames_[i], sphere.material));
    }
    for (size_t i = 0; i < hyperCuboids_.size(); ++i) {
        const auto& cuboid = hyperCuboids_[i];
        HYPERRAY_ENSURE(glm::all(glm::greaterThan(cuboid.half_extents, glm::vec4(0.0f))),
                        fmt::format("hyper cuboid '{}' has a non-positive half extent", hyperCuboidNames_[i]));
        HYPERRAY_ENSURE(cuboid.material < materialCount,
                        fmt::format("hyper cuboid '{}' references missing material {}", hyperCuboidNames_[i], cuboid.material));
    }
    for (size_t i = 0; i < hyperPlanes_.size(); ++i) {
        const auto& plane = hyperPlanes_[i];
        HYPERRAY_ENSURE(std::abs(glm::length(plane.normal) - 1.0f) < 1e-3f,
                        fmt::format("hyper plane '{}' normal is not unit length", hyperPlaneNames_[i]));
        HYPERRAY_ENSURE(plane.material < materialCount,
                        fmt::format("hyper plane '{}' references missing material {}", hyperPlaneNames_[i], plane.material));
    }

    return core::Result<void>::Ok();
}

shared::SceneView Scene::View() const {
    shared::SceneView view;
    view.hyper_spheres = hyperSpheres_;
    view.hyper_cuboids = hyperCuboids_;
    view.hyper_planes = hyperPlanes_;
    view.materials = materials_;
    view.sky = sky_;
    return view;
}

shared::FrameDesc Scene::MakeFrameDesc(const glm::uvec2& extent) const {
    shared::FrameDesc frame;
    frame.camera = camera_.ToKernelCamera();
    frame.scene = View();
    frame.render_extent = extent;
    return frame;
}

} // namespace hyperray::scene
