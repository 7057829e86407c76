// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <filesystem>
#include <string>

#include <spdlog/common.h>

namespace hyperray::config {

struct RenderConfig {
    unsigned output_width = 640;
    unsigned output_height = 360;
    std::filesystem::path output_path = "hyperray.png";
    std::filesystem::path scene_path; // empty selects the built-in default scene
    spdlog::level::level_enum log_level = spdlog::level::info;
    unsigned tile_size = 16;
    unsigned worker_count = 0; // 0 uses the hardware concurrency
    unsigned frame_limit = 1;
    std::filesystem::path config_path;
};

spdlog::level::level_enum parse_log_level(const std::string& value);

RenderConfig load_from_file(const std::filesystem::path& path);

} // namespace hyperray::config
