// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

#include <glm/glm.hpp>

#include "hyperray/core/result.h"

namespace hyperray::renderer {

/**
 * Row-major RGBA float render target.
 */
class Image {
public:
    Image(uint32_t width, uint32_t height);

    uint32_t Width() const { return width_; }
    uint32_t Height() const { return height_; }
    glm::uvec2 Extent() const { return glm::uvec2(width_, height_); }

    std::span<glm::vec4> Texels() { return texels_; }
    std::span<const glm::vec4> Texels() const { return texels_; }

    bool Contains(const glm::uvec2& pixel) const;

    /// Returns false and leaves the image untouched for out-of-bounds pixels
    bool Store(const glm::uvec2& pixel, const glm::vec4& color);

    /// Throws ImageError for out-of-bounds pixels
    glm::vec4 Load(const glm::uvec2& pixel) const;

    void Clear(const glm::vec4& color = glm::vec4(0.0f));

    /// 8-bit RGBA, each channel clamped to [0, 1] and rounded
    std::vector<uint8_t> ToRgba8() const;

    core::Result<void> WritePng(const std::filesystem::path& path) const;

private:
    uint32_t width_;
    uint32_t height_;
    std::vector<glm::vec4> texels_;
};

} // namespace hyperray::renderer
