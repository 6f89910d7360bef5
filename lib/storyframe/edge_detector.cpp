/// \file
/// \brief Heuristic asset bottom-edge detection.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#include "storyframe/edge_detector.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <string>

namespace {

struct rgb_mean {
    double r{0.0};
    double g{0.0};
    double b{0.0};
};

/// \brief corner_background.
rgb_mean corner_background(const raster_image& region) {
    const int inset = variance_edge_detector::k_corner_inset;
    const int left = std::min(inset, region.width - 1);
    const int top = std::min(inset, region.height - 1);
    const int right = std::clamp(region.width - inset, 0, region.width - 1);
    const int bottom = std::clamp(region.height - inset, 0, region.height - 1);
    const int corners[4][2] = {
        {left, top},
        {right, top},
        {left, bottom},
        {right, bottom},
    };

    rgb_mean bg;
    for (const auto& c : corners) {
        const rgba8 px = region.at(c[0], c[1]);
        bg.r += px.r;
        bg.g += px.g;
        bg.b += px.b;
    }
    bg.r /= 4.0;
    bg.g /= 4.0;
    bg.b /= 4.0;
    return bg;
}

/// \brief differs_from_background.
bool differs_from_background(const rgba8& c, const rgb_mean& bg) {
    const double diff = std::abs(c.r - bg.r) + std::abs(c.g - bg.g) + std::abs(c.b - bg.b);
    return diff > variance_edge_detector::k_background_diff_threshold;
}

} // namespace

/// \brief variance_edge_detector::color_variance.
double variance_edge_detector::color_variance(const rgba8* colors, int count) {
    if (!colors || count < 2) return 0.0;

    rgb_mean mean;
    for (int i = 0; i < count; ++i) {
        mean.r += colors[i].r;
        mean.g += colors[i].g;
        mean.b += colors[i].b;
    }
    mean.r /= count;
    mean.g /= count;
    mean.b /= count;

    double sum = 0.0;
    for (int i = 0; i < count; ++i) {
        sum += (colors[i].r - mean.r) * (colors[i].r - mean.r);
        sum += (colors[i].g - mean.g) * (colors[i].g - mean.g);
        sum += (colors[i].b - mean.b) * (colors[i].b - mean.b);
    }
    return sum / count;
}

/// \brief variance_edge_detector::detect_bottom_edge.
int variance_edge_detector::detect_bottom_edge(const raster_image& canvas) const {
    raster_image region;
    std::string err;
    if (!raster_ops::extract(canvas, region_, region, err)) return 0;

    const rgb_mean bg = corner_background(region);

    std::array<int, k_sample_fractions.size()> xs{};
    for (std::size_t i = 0; i < xs.size(); ++i) {
        xs[i] = static_cast<int>(std::floor(region.width * k_sample_fractions[i]));
    }

    std::array<rgba8, k_sample_fractions.size()> colors{};
    for (int y = region.height - 1; y >= 0; --y) {
        bool off_background = false;
        for (std::size_t i = 0; i < xs.size(); ++i) {
            colors[i] = region.at(xs[i], y);
            off_background = off_background || differs_from_background(colors[i], bg);
        }

        if (off_background || color_variance(colors.data(), static_cast<int>(colors.size())) > k_variance_threshold) {
            return region_.y + y;
        }
    }
    return 0;
}
