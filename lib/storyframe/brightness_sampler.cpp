/// \file
/// \brief Brightness sampling and adaptive shadow selection.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#include "storyframe/brightness_sampler.h"

#include <cmath>
#include <numeric>

namespace {

/// \brief neutral_sample.
brightness_sample neutral_sample() {
    brightness_sample out;
    out.samples.fill(brightness_sampler::k_neutral);
    out.average = brightness_sampler::k_neutral;
    out.degraded = true;
    return out;
}

} // namespace

/// \brief brightness_sampler::luma.
int brightness_sampler::luma(const rgba8& c) {
    return static_cast<int>(std::lround(0.299 * c.r + 0.587 * c.g + 0.114 * c.b));
}

/// \brief brightness_sampler::sample.
brightness_sample brightness_sampler::sample(const raster_image& canvas, const rect_i& region) {
    raster_image area;
    std::string err;
    if (!raster_ops::extract(canvas, region, area, err)) return neutral_sample();

    brightness_sample out;
    std::size_t i = 0;
    for (const double fy : k_grid_fractions) {
        const int y = static_cast<int>(std::floor(area.height * fy));
        for (const double fx : k_grid_fractions) {
            const int x = static_cast<int>(std::floor(area.width * fx));
            out.samples[i++] = luma(area.at(x, y));
        }
    }
    out.average = std::accumulate(out.samples.begin(), out.samples.end(), 0.0) / static_cast<double>(out.samples.size());
    return out;
}

/// \brief shadow_selector::select.
shadow_style shadow_selector::select(double average_brightness) {
    shadow_style s;
    if (average_brightness > k_light_background_threshold) {
        s.variant = shadow_variant::dark;
        s.color = {0, 0, 0, 204};
        s.css_color = "rgba(0,0,0,0.8)";
    } else {
        s.variant = shadow_variant::light;
        s.color = {255, 255, 255, 204};
        s.css_color = "rgba(255,255,255,0.8)";
    }
    return s;
}

const char* to_string(shadow_variant v) {
    return v == shadow_variant::dark ? "dark" : "light";
}
