// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "hyperray/core/config.hpp"
#include "hyperray/core/log.h"
#include "hyperray/core/time.hpp"
#include "hyperray/renderer/image.h"
#include "hyperray/renderer/renderer.h"
#include "hyperray/scene/scene.h"
#include "hyperray/scene/scene_loader.h"

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <utility>

namespace {

hyperray::scene::Scene load_scene(const hyperray::config::RenderConfig& config) {
    if (config.scene_path.empty()) {
        HYPERRAY_LOG_INFO("No scene configured, using the default scene");
        return hyperray::scene::Scene::Default();
    }

    auto scene = hyperray::scene::LoadScene(config.scene_path);
    return std::move(scene).Expect("Failed to load scene");
}

} // namespace

int main(int argc, char** argv) {
    const std::filesystem::path config_path = argc > 1 ? argv[1] : "data/config/render.json";
    const auto config = hyperray::config::load_from_file(config_path);

    hyperray::log::init(config.log_level);
    HYPERRAY_LOG_INFO("hyperray render starting - output {}x{}", config.output_width, config.output_height);

    try {
        const hyperray::scene::Scene scene = load_scene(config);
        HYPERRAY_LOG_INFO("Scene has {} primitives and {} materials", scene.PrimitiveCount(), scene.Materials().size());

        hyperray::renderer::RendererDesc desc;
        desc.tile_size = config.tile_size;
        desc.worker_count = config.worker_count;
        const hyperray::renderer::Renderer renderer(desc);

        hyperray::renderer::Image image(config.output_width, config.output_height);
        const auto frame = scene.MakeFrameDesc(image.Extent());

        hyperray::time::FrameTimer frame_timer;
        for (unsigned frame_count = 0; frame_count < config.frame_limit; ++frame_count) {
            renderer.Render(frame, image);

            const double dt = frame_timer.tick();
            HYPERRAY_LOG_INFO("Frame {} | dt = {:.2f} ms", frame_count, dt * 1000.0);
        }
        HYPERRAY_LOG_INFO("Rendered {} frame(s) in {:.3f} s", config.frame_limit, frame_timer.total_seconds());

        image.WritePng(config.output_path).Expect("Failed to write output image");
    } catch (const std::exception& err) {
        HYPERRAY_LOG_CRITICAL("{}", err.what());
        return EXIT_FAILURE;
    }

    HYPERRAY_LOG_INFO("hyperray render shutdown complete");
    return EXIT_SUCCESS;
}
