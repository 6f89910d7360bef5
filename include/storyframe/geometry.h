/// \file
/// \brief Story canvas, UI exclusion bands and content rectangle constants.
///
/// This header declares the fixed layout every storyframe stage uses for absolute pixel math.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#pragma once

#include <algorithm>

struct rect_i {
    int x{0};
    int y{0};
    int width{0};
    int height{0};

    [[nodiscard]] constexpr int right() const { return x + width; }
    [[nodiscard]] constexpr int bottom() const { return y + height; }
    [[nodiscard]] constexpr bool contains(const rect_i& other) const {
        return other.x >= x && other.y >= y && other.right() <= right() && other.bottom() <= bottom();
    }
};

constexpr bool operator==(const rect_i& a, const rect_i& b) {
    return a.x == b.x && a.y == b.y && a.width == b.width && a.height == b.height;
}

namespace story_canvas {

constexpr int width = 1080;
constexpr int height = 1920;

// UI exclusion bands (profile header on top, reply bar at the bottom)
constexpr int top_band_height = 250;    // 13% of height
constexpr int bottom_band_height = 180; // 9% of height

// content rectangle: 70% of each axis, centered
constexpr int content_width = width * 70 / 100;
constexpr int content_height = height * 70 / 100;
constexpr int content_x = (width - content_width) / 2;
constexpr int content_y = (height - content_height) / 2;

constexpr int center_x = width / 2;

constexpr rect_i bounds() { return {0, 0, width, height}; }
constexpr rect_i top_band() { return {0, 0, width, top_band_height}; }
constexpr rect_i bottom_band() { return {0, height - bottom_band_height, width, bottom_band_height}; }
constexpr rect_i content_rect() { return {content_x, content_y, content_width, content_height}; }

static_assert(content_width == 756 && content_height == 1344, "content rectangle must be 756x1344");
static_assert(content_x == 162 && content_y == 288, "content rectangle must be centered");
static_assert(top_band_height <= content_y, "top band overlaps content rectangle");
static_assert(height - bottom_band_height >= content_y + content_height, "bottom band overlaps content rectangle");

} // namespace story_canvas

/// \brief Intersect \p r with \p clip; returns an empty rect when they do not overlap.
constexpr rect_i clip_rect(const rect_i& r, const rect_i& clip) {
    const int left = std::max(r.x, clip.x);
    const int top = std::max(r.y, clip.y);
    const int right = std::min(r.right(), clip.right());
    const int bottom = std::min(r.bottom(), clip.bottom());
    if (right <= left || bottom <= top) return {left, top, 0, 0};
    return {left, top, right - left, bottom - top};
}
