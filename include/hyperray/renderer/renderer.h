// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

#include "hyperray/renderer/image.h"
#include "hyperray/shared/scene_view.h"

namespace hyperray::renderer {

struct Tile {
    glm::uvec2 origin;
    glm::uvec2 extent;
};

struct RendererDesc {
    uint32_t tile_size = 16;
    uint32_t worker_count = 0; // 0 = hardware concurrency
};

/**
 * Dispatches the per-pixel kernel over an image in fixed-size tiles.
 *
 * Tiles are handed to worker tasks in no particular order; every pixel is
 * written by exactly one task, so no synchronization is needed beyond the
 * tile counter. Render() returns once every tile has completed.
 */
class Renderer {
public:
    explicit Renderer(const RendererDesc& desc = {});

    uint32_t TileSize() const { return tileSize_; }
    uint32_t WorkerCount() const { return workerCount_; }

    void Render(const shared::FrameDesc& frame, Image& output) const;

    static std::vector<Tile> MakeTiles(const glm::uvec2& extent, uint32_t tileSize);

private:
    uint32_t tileSize_;
    uint32_t workerCount_;
};

} // namespace hyperray::renderer
