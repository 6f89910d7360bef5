/// \file
/// \brief FreeType rasterization of a caption layout, with drop shadow, onto a story canvas.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#pragma once

#include <string>
#include <vector>

#include "storyframe/raster_image.h"
#include "storyframe/text_layout.h"

class caption_renderer {
public:
    static constexpr int k_shadow_dx = 0;
    static constexpr int k_shadow_dy = 2;
    static constexpr double k_shadow_sigma = 4.0;

    /// Draw every line of \p layout centered on its anchor, shadow first. \p canvas is left
    /// untouched when the font cannot be loaded or a glyph fails to render.
    static bool render(raster_image& canvas, const caption_layout& layout, std::string& err);

private:
    static void blur(std::vector<float>& plane, int width, int height, double sigma);
};
