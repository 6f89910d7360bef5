/// \file
/// \brief Asset scaler.
///
/// This source file implements one part of the storyframe composition engine.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#include "storyframe/asset_scaler.h"

#include <algorithm>
#include <cmath>

/// \brief asset_scaler::fit.
scaled_placement asset_scaler::fit(int src_width, int src_height, const rect_i& target) {
    scaled_placement out;
    out.source_aspect_ratio = static_cast<double>(src_width) / static_cast<double>(src_height);
    const double target_aspect = static_cast<double>(target.width) / static_cast<double>(target.height);

    int w = 0;
    int h = 0;
    if (out.source_aspect_ratio > target_aspect) {
        // relatively wider than the target: width is the binding side
        w = target.width;
        h = static_cast<int>(std::lround(w / out.source_aspect_ratio));
        out.scale_factor = static_cast<double>(target.width) / src_width;
    } else {
        h = target.height;
        w = static_cast<int>(std::lround(h * out.source_aspect_ratio));
        out.scale_factor = static_cast<double>(target.height) / src_height;
        if (w > target.width) {
            w = target.width;
            h = static_cast<int>(std::lround(w / out.source_aspect_ratio));
            out.scale_factor = static_cast<double>(target.width) / src_width;
        }
    }

    // rounding can push a derived side one pixel past the target at extreme ratios
    out.width = std::clamp(w, 1, target.width);
    out.height = std::clamp(h, 1, target.height);
    out.x = target.x + static_cast<int>(std::lround((target.width - out.width) / 2.0));
    out.y = target.y + static_cast<int>(std::lround((target.height - out.height) / 2.0));
    return out;
}
