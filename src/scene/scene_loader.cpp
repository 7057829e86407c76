// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "hyperray/scene/scene_loader.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <fmt/format.h>
#include <glm/gtc/constants.hpp>
#include <nlohmann/json.hpp>

#include "hyperray/core/log.h"

namespace hyperray::scene {

namespace {

using nlohmann::json;

glm::vec4 ReadVec4(const json& value) {
    if (!value.is_array() || value.size() != 4) {
        throw std::invalid_argument(fmt::format("expected an array of 4 numbers, got {}", value.dump()));
    }
    return glm::vec4(value[0].get<float>(), value[1].get<float>(), value[2].get<float>(), value[3].get<float>());
}

glm::vec3 ReadVec3(const json& value) {
    if (!value.is_array() || value.size() != 3) {
        throw std::invalid_argument(fmt::format("expected an array of 3 numbers, got {}", value.dump()));
    }
    return glm::vec3(value[0].get<float>(), value[1].get<float>(), value[2].get<float>());
}

float ReadDegrees(const json& object, const char* key, float fallbackRadians) {
    if (!object.contains(key)) {
        return fallbackRadians;
    }
    return glm::radians(object[key].get<float>());
}

void ReadCamera(const json& node, renderer::CameraRig& camera) {
    if (node.contains("position")) camera.position = ReadVec4(node["position"]);
    camera.pitch = ReadDegrees(node, "pitch", camera.pitch);
    camera.yaw = ReadDegrees(node, "yaw", camera.yaw);
    camera.weird_pitch = ReadDegrees(node, "weird_pitch", camera.weird_pitch);
    camera.weird_yaw = ReadDegrees(node, "weird_yaw", camera.weird_yaw);
    camera.fov = ReadDegrees(node, "fov", camera.fov);
    camera.min_distance = node.value("min_distance", camera.min_distance);
    camera.max_distance = node.value("max_distance", camera.max_distance);
    camera.bounce_count = node.value("bounce_count", camera.bounce_count);
    camera.sample_count = node.value("sample_count", camera.sample_count);
}

shared::Material ReadMaterial(const json& node) {
    shared::Material material;
    if (node.contains("base_color")) material.base_color = ReadVec3(node["base_color"]);
    if (node.contains("emissive_color")) material.emissive_color = ReadVec3(node["emissive_color"]);
    material.emission_strength = node.value("emission_strength", material.emission_strength);
    return material;
}

Scene ReadScene(const json& root) {
    Scene scene;

    if (auto camera = root.find("camera"); camera != root.end()) {
        ReadCamera(*camera, scene.Camera());
    }

    if (auto sky = root.find("sky"); sky != root.end()) {
        if (sky->contains("down")) scene.Sky().down = ReadVec3((*sky)["down"]);
        if (sky->contains("up")) scene.Sky().up = ReadVec3((*sky)["up"]);
    }

    if (auto materials = root.find("materials"); materials != root.end()) {
        for (const auto& node : *materials) {
            scene.AddMaterial(ReadMaterial(node));
        }
    }

    if (auto spheres = root.find("hyper_spheres"); spheres != root.end()) {
        for (const auto& node : *spheres) {
            shared::HyperSphere sphere;
            sphere.center = ReadVec4(node.at("center"));
            sphere.radius = node.at("radius").get<float>();
            sphere.material = node.at("material").get<uint32_t>();
            scene.AddHyperSphere(node.value("name", std::string("Hyper Sphere")), sphere);
        }
    }

    if (auto cuboids = root.find("hyper_cuboids"); cuboids != root.end()) {
        for (const auto& node : *cuboids) {
            shared::HyperCuboid cuboid;
            cuboid.center = ReadVec4(node.at("center"));
            cuboid.half_extents = ReadVec4(node.at("half_extents"));
            cuboid.material = node.at("material").get<uint32_t>();
            scene.AddHyperCuboid(node.value("name", std::string("Hyper Cuboid")), cuboid);
        }
    }

    if (auto planes = root.find("hyper_planes"); planes != root.end()) {
        for (const auto& node : *planes) {
            shared::HyperPlane plane;
            plane.point = ReadVec4(node.at("point"));
            const glm::vec4 normal = ReadVec4(node.at("normal"));
            if (glm::dot(normal, normal) == 0.0f) {
                throw std::invalid_argument("hyper plane normal must be non-zero");
            }
            plane.normal = glm::normalize(normal);
            plane.material = node.at("material").get<uint32_t>();
            scene.AddHyperPlane(node.value("name", std::string("Hyper Plane")), plane);
        }
    }

    return scene;
}

} // namespace

core::Result<Scene> ParseScene(const std::string& text) {
    Scene scene;
    try {
        scene = ReadScene(json::parse(text));
    } catch (const std::exception& err) {
        return core::Result<Scene>::Err(fmt::format("Failed to parse scene: {}", err.what()));
    }

    auto validation = scene.Validate();
    if (validation.IsErr()) {
        return core::Result<Scene>::Err(std::move(validation).GetError().WithContext("Invalid scene"));
    }

    HYPERRAY_LOG_DEBUG("Parsed scene: {} primitives, {} materials", scene.PrimitiveCount(), scene.Materials().size());
    return scene;
}

core::Result<Scene> LoadScene(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return core::Result<Scene>::Err(fmt::format("Failed to open scene file: {}", path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    HYPERRAY_LOG_INFO("Loading scene from {}", path.string());
    return ParseScene(buffer.str()).WithContext(path.string());
}

} // namespace hyperray::scene
