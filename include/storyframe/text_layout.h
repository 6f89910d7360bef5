/// \file
/// \brief Caption word-wrapping and positioned SVG markup generation.
///
/// This header declares the caption style, the wrapped/positioned layout the renderer consumes,
/// and the UTF-8 helpers both share.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "storyframe/brightness_sampler.h"
#include "storyframe/geometry.h"

struct caption_style {
    std::filesystem::path font_path{"assets/fonts/Lato-Regular.ttf"};
    std::string font_family{"Lato"};
    int font_size{42};
    int font_weight{700};
    std::string fill{"#FFFFFF"};
    int max_width{900};
    int anchor_x{story_canvas::center_x};
    double letter_spacing_em{-0.02};
    double line_height_factor{1.3};
    double glyph_width_factor{0.52}; // average advance of the caption face, in em
};

struct caption_line {
    std::string text; // UTF-8, soft hyphens resolved
    double baseline_y{0.0};
};

struct caption_layout {
    caption_style style;
    shadow_style shadow;
    int y{0};
    double line_height{0.0};
    std::vector<caption_line> lines;
    std::string markup; // standalone SVG document
};

namespace utf8 {

std::u32string decode(std::string_view s);
std::string encode(std::u32string_view s);

} // namespace utf8

class text_layout {
public:
    static constexpr std::size_t k_max_lines = 3;
    static constexpr char32_t k_soft_hyphen = U'\u00AD';

    /// floor((max_width / font_size) / glyph_width_factor), never below 1.
    static int chars_per_line(int max_width, int font_size, double glyph_width_factor);

    /// Greedy wrap into at most k_max_lines lines of at most \p max_chars code points.
    /// Words past the third line are dropped. Empty input yields one empty line.
    static std::vector<std::string> wrap(std::string_view text, int max_chars);

    static std::string escape_xml(std::string_view text);

    /// Wrap \p text with \p style and position it with its first baseline at \p y.
    static bool build(
        std::string_view text,
        const caption_style& style,
        int y,
        const shadow_style& shadow,
        caption_layout& out,
        std::string& err
    );

    /// Caption bounding box used for brightness sampling, clipped to the canvas.
    static rect_i caption_box(const caption_style& style, int y);
};
