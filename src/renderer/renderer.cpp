// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "hyperray/renderer/renderer.h"

#include <algorithm>
#include <atomic>
#include <future>
#include <thread>

#include <fmt/format.h>

#include "hyperray/core/common.hpp"
#include "hyperray/core/error.hpp"
#include "hyperray/core/log.h"
#include "hyperray/core/time.hpp"
#include "hyperray/kernel/ray_trace.h"

namespace hyperray::renderer {

Renderer::Renderer(const RendererDesc& desc)
    : tileSize_(std::max(desc.tile_size, 1u)),
      workerCount_(desc.worker_count) {
    if (workerCount_ == 0) {
        workerCount_ = std::max(std::thread::hardware_concurrency(), 1u);
    }
}

std::vector<Tile> Renderer::MakeTiles(const glm::uvec2& extent, uint32_t tileSize) {
    std::vector<Tile> tiles;
    if (tileSize == 0) {
        return tiles;
    }

    const uint32_t tilesX = (extent.x + tileSize - 1) / tileSize;
    const uint32_t tilesY = (extent.y + tileSize - 1) / tileSize;
    tiles.reserve(static_cast<size_t>(tilesX) * tilesY);

    for (uint32_t ty = 0; ty < tilesY; ++ty) {
        for (uint32_t tx = 0; tx < tilesX; ++tx) {
            const glm::uvec2 origin(tx * tileSize, ty * tileSize);
            const glm::uvec2 extentInTile = glm::min(glm::uvec2(tileSize), extent - origin);
            tiles.push_back(Tile{origin, extentInTile});
        }
    }
    return tiles;
}

void Renderer::Render(const shared::FrameDesc& frame, Image& output) const {
    if (output.Extent() != frame.render_extent) {
        throw ImageError(fmt::format("render extent {}x{} does not match image {}x{}",
                                     frame.render_extent.x, frame.render_extent.y,
                                     output.Width(), output.Height()));
    }

    time::ScopedTimer timer("render");
    const std::vector<Tile> tiles = MakeTiles(frame.render_extent, tileSize_);
    HYPERRAY_ASSERT(!tiles.empty());
    const std::span<glm::vec4> texels = output.Texels();
    std::atomic<size_t> nextTile{0};

    auto worker = [&]() {
        for (size_t index = nextTile.fetch_add(1); index < tiles.size(); index = nextTile.fetch_add(1)) {
            const Tile& tile = tiles[index];
            for (uint32_t y = 0; y < tile.extent.y; ++y) {
                for (uint32_t x = 0; x < tile.extent.x; ++x) {
                    kernel::RayTrace(tile.origin + glm::uvec2(x, y), frame, texels);
                }
            }
        }
    };

    const size_t taskCount = std::min<size_t>(workerCount_, tiles.size());
    HYPERRAY_LOG_DEBUG("Dispatching {} tiles of {}x{} over {} workers", tiles.size(), tileSize_, tileSize_, taskCount);

    std::vector<std::future<void>> tasks;
    tasks.reserve(taskCount);
    for (size_t i = 0; i < taskCount; ++i) {
        tasks.push_back(std::async(std::launch::async, worker));
    }
    for (auto& task : tasks) {
        task.get();
    }
}

} // namespace hyperray::renderer
