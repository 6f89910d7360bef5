/// \file
/// \brief Aspect-preserving fit-and-center placement of a foreground asset.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#pragma once

#include "storyframe/geometry.h"

struct scaled_placement {
    int width{0};
    int height{0};
    int x{0};
    int y{0};
    double scale_factor{0.0};
    double source_aspect_ratio{0.0};

    [[nodiscard]] rect_i rect() const { return {x, y, width, height}; }
};

class asset_scaler {
public:
    /// Fit a source of \p src_width x \p src_height inside \p target, preserving its aspect
    /// ratio, and center it on both axes. Both source dimensions must be positive.
    static scaled_placement fit(int src_width, int src_height, const rect_i& target = story_canvas::content_rect());
};
