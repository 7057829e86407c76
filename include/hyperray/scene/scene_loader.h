// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <filesystem>
#include <string>

#include "hyperray/core/result.h"
#include "hyperray/scene/scene.h"

namespace hyperray::scene {

/**
 * Parses a JSON scene document.
 *
 * Top-level keys (all optional): "camera", "sky", "materials",
 * "hyper_spheres", "hyper_cuboids", "hyper_planes". Vectors are JSON arrays,
 * camera angles are in degrees. The parsed scene is validated before it is
 * returned.
 */
core::Result<Scene> ParseScene(const std::string& text);

core::Result<Scene> LoadScene(const std::filesystem::path& path);

} // namespace hyperray::scene
