/// \file
/// \brief RGBA8 raster buffer with decode, encode, crop, resample and layering.
///
/// This header declares the pixel container shared by the compositor, the edge detector,
/// the brightness sampler and the caption renderer.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "storyframe/geometry.h"

struct rgba8 {
    std::uint8_t r{0};
    std::uint8_t g{0};
    std::uint8_t b{0};
    std::uint8_t a{255};
};

enum class fit_mode {
    cover,  // fill the target, crop overflow
    contain // keep all content, pad with transparency
};

struct raster_image {
    int width{0};
    int height{0};
    std::vector<std::uint8_t> pixels; // RGBA, row-major, stride = width * 4

    raster_image() = default;
    raster_image(int w, int h, rgba8 fill = {0, 0, 0, 0});

    [[nodiscard]] bool empty() const { return width <= 0 || height <= 0 || pixels.empty(); }
    [[nodiscard]] int stride() const { return width * 4; }

    [[nodiscard]] rgba8 at(int x, int y) const {
        const std::size_t i = (static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x)) * 4;
        return {pixels[i + 0], pixels[i + 1], pixels[i + 2], pixels[i + 3]};
    }

    void set(int x, int y, rgba8 c) {
        const std::size_t i = (static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x)) * 4;
        pixels[i + 0] = c.r;
        pixels[i + 1] = c.g;
        pixels[i + 2] = c.b;
        pixels[i + 3] = c.a;
    }

    void fill_rect(const rect_i& r, rgba8 c);
};

class raster_io {
public:
    /// Decode a PNG or JPEG file into RGBA8.
    static bool load(const std::filesystem::path& path, raster_image& out, std::string& err);

    /// Encode as PNG; the extension of \p path is not consulted.
    static bool save_png(const std::filesystem::path& path, const raster_image& img, std::string& err);
};

class raster_ops {
public:
    /// Copy a sub-rectangle. Fails when \p region is not fully inside \p src.
    static bool extract(const raster_image& src, const rect_i& region, raster_image& out, std::string& err);

    /// Resample \p src to exactly \p width x \p height using \p mode.
    static bool resize(const raster_image& src, int width, int height, fit_mode mode, raster_image& out, std::string& err);

    /// Alpha-blend \p layer over \p base with its top-left corner at (\p left, \p top).
    static void composite_over(raster_image& base, const raster_image& layer, int left, int top);
};
