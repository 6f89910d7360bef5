/// \file
/// \brief RGBA8 raster decode, encode, crop, resample and alpha layering.
///
/// This source file implements one part of the storyframe composition engine. Decoding uses
/// stb_image, encoding stb_image_write and resampling stb_image_resize2.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#include "storyframe/raster_image.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <memory>

extern "C" {
#include <stb_image.h>
#include <stb_image_resize2.h>
#include <stb_image_write.h>
}

namespace {

/// \brief blend_channel.
inline std::uint8_t blend_channel(int src, int dst, int alpha) {
    return static_cast<std::uint8_t>((src * alpha + dst * (255 - alpha) + 127) / 255);
}

/// \brief resample_region.
bool resample_region(
    const raster_image& src,
    const rect_i& region,
    int out_w,
    int out_h,
    raster_image& out,
    std::string& err
) {
    out = raster_image(out_w, out_h);
    const unsigned char* origin = src.pixels.data()
        + static_cast<std::size_t>(region.y) * static_cast<std::size_t>(src.stride())
        + static_cast<std::size_t>(region.x) * 4;
    const unsigned char* res = stbir_resize_uint8_linear(
        origin, region.width, region.height, src.stride(),
        out.pixels.data(), out_w, out_h, out.stride(),
        STBIR_RGBA
    );
    if (!res) {
        err = "resample failed (" + std::to_string(region.width) + "x" + std::to_string(region.height)
            + " -> " + std::to_string(out_w) + "x" + std::to_string(out_h) + ")";
        return false;
    }
    return true;
}

} // namespace

raster_image::raster_image(int w, int h, rgba8 fill)
    : width(w), height(h), pixels(static_cast<std::size_t>(w) * static_cast<std::size_t>(h) * 4, 0) {
    if (fill.r || fill.g || fill.b || fill.a) fill_rect({0, 0, w, h}, fill);
}

/// \brief raster_image::fill_rect.
void raster_image::fill_rect(const rect_i& r, rgba8 c) {
    const rect_i clipped = clip_rect(r, {0, 0, width, height});
    for (int y = clipped.y; y < clipped.bottom(); ++y) {
        for (int x = clipped.x; x < clipped.right(); ++x) set(x, y, c);
    }
}

/// \brief raster_io::load.
bool raster_io::load(const std::filesystem::path& path, raster_image& out, std::string& err) {
    int w = 0;
    int h = 0;
    int channels = 0;
    std::unique_ptr<unsigned char, decltype(&stbi_image_free)> data(
        stbi_load(path.string().c_str(), &w, &h, &channels, 4), &stbi_image_free);
    if (!data || w <= 0 || h <= 0) {
        const char* reason = stbi_failure_reason();
        err = "failed to decode image " + path.string() + (reason ? std::string(": ") + reason : std::string());
        return false;
    }

    out = {};
    out.width = w;
    out.height = h;
    out.pixels.assign(data.get(), data.get() + static_cast<std::size_t>(w) * static_cast<std::size_t>(h) * 4);
    return true;
}

/// \brief raster_io::save_png.
bool raster_io::save_png(const std::filesystem::path& path, const raster_image& img, std::string& err) {
    if (img.empty()) {
        err = "refusing to encode an empty image to " + path.string();
        return false;
    }
    if (stbi_write_png(path.string().c_str(), img.width, img.height, 4, img.pixels.data(), img.stride()) == 0) {
        err = "failed to write png: " + path.string();
        return false;
    }
    return true;
}

/// \brief raster_ops::extract.
bool raster_ops::extract(const raster_image& src, const rect_i& region, raster_image& out, std::string& err) {
    if (src.empty() || region.width <= 0 || region.height <= 0 || !rect_i{0, 0, src.width, src.height}.contains(region)) {
        err = "extract region " + std::to_string(region.x) + "," + std::to_string(region.y) + " "
            + std::to_string(region.width) + "x" + std::to_string(region.height) + " is outside the "
            + std::to_string(src.width) + "x" + std::to_string(src.height) + " image";
        return false;
    }

    out = raster_image(region.width, region.height);
    const std::size_t row_bytes = static_cast<std::size_t>(region.width) * 4;
    for (int y = 0; y < region.height; ++y) {
        const std::uint8_t* s = src.pixels.data()
            + static_cast<std::size_t>(region.y + y) * static_cast<std::size_t>(src.stride())
            + static_cast<std::size_t>(region.x) * 4;
        std::uint8_t* d = out.pixels.data() + static_cast<std::size_t>(y) * row_bytes;
        std::memcpy(d, s, row_bytes);
    }
    return true;
}

/// \brief raster_ops::resize.
bool raster_ops::resize(const raster_image& src, int width, int height, fit_mode mode, raster_image& out, std::string& err) {
    if (src.empty()) {
        err = "cannot resize an empty image";
        return false;
    }
    if (width <= 0 || height <= 0) {
        err = "invalid resize target " + std::to_string(width) + "x" + std::to_string(height);
        return false;
    }

    const double src_aspect = static_cast<double>(src.width) / src.height;
    const double dst_aspect = static_cast<double>(width) / height;

    if (mode == fit_mode::cover) {
        // crop the centered region with the target aspect, then scale it to fill exactly
        rect_i crop{0, 0, src.width, src.height};
        if (src_aspect > dst_aspect) {
            crop.width = std::clamp(static_cast<int>(std::lround(src.height * dst_aspect)), 1, src.width);
        } else {
            crop.height = std::clamp(static_cast<int>(std::lround(src.width / dst_aspect)), 1, src.height);
        }
        crop.x = (src.width - crop.width) / 2;
        crop.y = (src.height - crop.height) / 2;
        return resample_region(src, crop, width, height, out, err);
    }

    const double scale = std::min(static_cast<double>(width) / src.width, static_cast<double>(height) / src.height);
    const int fit_w = std::clamp(static_cast<int>(std::lround(src.width * scale)), 1, width);
    const int fit_h = std::clamp(static_cast<int>(std::lround(src.height * scale)), 1, height);

    raster_image fitted;
    if (!resample_region(src, {0, 0, src.width, src.height}, fit_w, fit_h, fitted, err)) return false;
    if (fit_w == width && fit_h == height) {
        out = std::move(fitted);
        return true;
    }

    out = raster_image(width, height); // transparent padding
    const std::size_t row_bytes = static_cast<std::size_t>(fit_w) * 4;
    const int off_x = (width - fit_w) / 2;
    const int off_y = (height - fit_h) / 2;
    for (int y = 0; y < fit_h; ++y) {
        std::memcpy(
            out.pixels.data() + static_cast<std::size_t>(off_y + y) * static_cast<std::size_t>(out.stride()) + static_cast<std::size_t>(off_x) * 4,
            fitted.pixels.data() + static_cast<std::size_t>(y) * row_bytes,
            row_bytes
        );
    }
    return true;
}

/// \brief raster_ops::composite_over.
void raster_ops::composite_over(raster_image& base, const raster_image& layer, int left, int top) {
    const rect_i dst = clip_rect({left, top, layer.width, layer.height}, {0, 0, base.width, base.height});
    for (int y = dst.y; y < dst.bottom(); ++y) {
        for (int x = dst.x; x < dst.right(); ++x) {
            const rgba8 s = layer.at(x - left, y - top);
            if (s.a == 0) continue;
            if (s.a == 255) {
                base.set(x, y, s);
                continue;
            }
            const rgba8 d = base.at(x, y);
            rgba8 o;
            o.r = blend_channel(s.r, d.r, s.a);
            o.g = blend_channel(s.g, d.g, s.a);
            o.b = blend_channel(s.b, d.b, s.a);
            o.a = static_cast<std::uint8_t>(s.a + (d.a * (255 - s.a) + 127) / 255);
            base.set(x, y, o);
        }
    }
}
