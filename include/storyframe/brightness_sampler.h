/// \file
/// \brief Perceived-brightness sampling under the caption and adaptive shadow selection.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#pragma once

#include <array>
#include <string>

#include "storyframe/geometry.h"
#include "storyframe/raster_image.h"

struct brightness_sample {
    std::array<int, 9> samples{}; // row-major 3x3 grid, each 0..255
    double average{0.0};
    bool degraded{false};         // neutral values returned after an extraction failure
};

enum class shadow_variant {
    dark, // light background
    light // dark background
};

struct shadow_style {
    shadow_variant variant{shadow_variant::dark};
    rgba8 color{0, 0, 0, 204};
    std::string css_color; // e.g. "rgba(0,0,0,0.8)"
};

class brightness_sampler {
public:
    static constexpr int k_neutral = 128;
    static constexpr std::array<double, 3> k_grid_fractions = {0.167, 0.5, 0.833};

    /// ITU-R BT.601 luma rounded to 0..255.
    static int luma(const rgba8& c);

    /// Never fails: an out-of-bounds or empty \p region yields neutral samples.
    static brightness_sample sample(const raster_image& canvas, const rect_i& region);
};

class shadow_selector {
public:
    static constexpr double k_light_background_threshold = 127.5;

    static shadow_style select(double average_brightness);
};

const char* to_string(shadow_variant v);
