// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "hyperray/renderer/image.h"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

#include "hyperray/core/error.hpp"
#include "hyperray/core/log.h"

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace hyperray::renderer {

Image::Image(uint32_t width, uint32_t height)
    : width_(width), height_(height) {
    if (width == 0 || height == 0) {
        throw ImageError(fmt::format("invalid image extent {}x{}", width, height));
    }
    texels_.assign(static_cast<size_t>(width) * height, glm::vec4(0.0f));
}

bool Image::Contains(const glm::uvec2& pixel) const {
    return pixel.x < width_ && pixel.y < height_;
}

bool Image::Store(const glm::uvec2& pixel, const glm::vec4& color) {
    if (!Contains(pixel)) {
        return false;
    }
    texels_[static_cast<size_t>(pixel.y) * width_ + pixel.x] = color;
    return true;
}

glm::vec4 Image::Load(const glm::uvec2& pixel) const {
    if (!Contains(pixel)) {
        throw ImageError(fmt::format("pixel ({}, {}) outside {}x{} image", pixel.x, pixel.y, width_, height_));
    }
    return texels_[static_cast<size_t>(pixel.y) * width_ + pixel.x];
}

void Image::Clear(const glm::vec4& color) {
    std::fill(texels_.begin(), texels_.end(), color);
}

std::vector<uint8_t> Image::ToRgba8() const {
    std::vector<uint8_t> bytes;
    bytes.reserve(texels_.size() * 4);
    for (const auto& texel : texels_) {
        for (int channel = 0; channel < 4; ++channel) {
            const float value = std::clamp(texel[channel], 0.0f, 1.0f);
            bytes.push_back(static_cast<uint8_t>(std::lround(value * 255.0f)));
        }
    }
    return bytes;
}

core::Result<void> Image::WritePng(const std::filesystem::path& path) const {
    const std::vector<uint8_t> bytes = ToRgba8();
    const int stride = static_cast<int>(width_) * 4;

    const int written = stbi_write_png(path.string().c_str(), static_cast<int>(width_), static_cast<int>(height_),
                                       4, bytes.data(), stride);
    if (written == 0) {
        return core::Result<void>::Err(fmt::format("Failed to write PNG: {}", path.string()));
    }

    HYPERRAY_LOG_INFO("Wrote {}x{} image to {}", width_, height_, path.string());
    return core::Result<void>::Ok();
}

} // namespace hyperray::renderer
