/// \file
/// \brief Foreground lower-boundary detection on a composed story canvas.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#pragma once

#include <array>

#include "storyframe/geometry.h"
#include "storyframe/raster_image.h"

class bottom_edge_detector {
public:
    virtual ~bottom_edge_detector() = default;

    /// Absolute canvas Y of the asset's visual bottom edge, or 0 when nothing was detected.
    virtual int detect_bottom_edge(const raster_image& canvas) const = 0;
};

/// Row-scan heuristic: compares 5 samples per row against each other and against the
/// background color averaged from the region's corners. Not a segmentation.
class variance_edge_detector : public bottom_edge_detector {
public:
    static constexpr double k_variance_threshold = 100.0;
    static constexpr int k_background_diff_threshold = 30; // |dr| + |dg| + |db|
    static constexpr int k_corner_inset = 10;
    static constexpr std::array<double, 5> k_sample_fractions = {0.2, 0.35, 0.5, 0.65, 0.8};

    explicit variance_edge_detector(rect_i region = story_canvas::content_rect()) : region_(region) {}

    int detect_bottom_edge(const raster_image& canvas) const override;

    /// Mean over samples of the squared per-channel distance to the sample mean.
    static double color_variance(const rgba8* colors, int count);

private:
    rect_i region_;
};
