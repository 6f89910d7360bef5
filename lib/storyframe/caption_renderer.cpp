/// \file
/// \brief FreeType-based caption rasterization with a blurred drop shadow.
///
/// This source file implements one part of the storyframe composition engine. Glyph runs come
/// from the text layout; coverage is accumulated into an alpha plane, blurred for the shadow and
/// alpha-blended onto the canvas.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#include "storyframe/caption_renderer.h"
#include "storyframe/parse_util.h"

#include <algorithm>
#include <climits>
#include <cmath>
#include <cstdint>
#include <vector>

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_OUTLINE_H

namespace {

struct ft_session {
    FT_Library library{nullptr};
    FT_Face face{nullptr};

    ft_session() = default;
    ft_session(const ft_session&) = delete;
    ft_session& operator=(const ft_session&) = delete;

    ~ft_session() {
        if (face) FT_Done_Face(face);
        if (library) FT_Done_FreeType(library);
    }
};

struct placed_glyph {
    std::vector<std::uint8_t> coverage; // width * rows, 0..255
    int width{0};
    int rows{0};
    int left{0};  // bitmap_left
    int top{0};   // bitmap_top
    int pen_x{0}; // pen position within the line
};

struct ink_bounds {
    int left{INT_MAX};
    int top{INT_MAX};
    int right{INT_MIN};
    int bottom{INT_MIN};

    [[nodiscard]] bool empty() const { return right < left || bottom < top; }
};

/// \brief copy_coverage.
void copy_coverage(const FT_Bitmap& bmp, placed_glyph& g) {
    g.width = static_cast<int>(bmp.width);
    g.rows = static_cast<int>(bmp.rows);
    g.coverage.assign(static_cast<std::size_t>(g.width) * static_cast<std::size_t>(g.rows), 0);
    if (!bmp.buffer) return;

    const int pitch = std::abs(static_cast<int>(bmp.pitch));
    for (int y = 0; y < g.rows; ++y) {
        const unsigned char* row = bmp.buffer + static_cast<std::size_t>(y) * static_cast<std::size_t>(pitch);
        std::uint8_t* dst = g.coverage.data() + static_cast<std::size_t>(y) * static_cast<std::size_t>(g.width);
        for (int x = 0; x < g.width; ++x) {
            if (bmp.pixel_mode == FT_PIXEL_MODE_MONO) {
                dst[x] = (row[x / 8] & (0x80u >> (x % 8))) ? 255 : 0;
            } else {
                dst[x] = row[x];
            }
        }
    }
}

/// \brief rasterize_line.
bool rasterize_line(
    FT_Face face,
    const std::u32string& text,
    double letter_spacing_px,
    FT_Pos embolden,
    std::vector<placed_glyph>& out,
    int& line_width,
    std::string& err
) {
    out.clear();
    double pen = 0.0;
    FT_UInt previous = 0;
    const bool kerning = FT_HAS_KERNING(face);

    for (std::size_t i = 0; i < text.size(); ++i) {
        const FT_UInt index = FT_Get_Char_Index(face, static_cast<FT_ULong>(text[i]));
        if (kerning && previous && index) {
            FT_Vector delta{};
            if (FT_Get_Kerning(face, previous, index, FT_KERNING_DEFAULT, &delta) == 0) pen += static_cast<double>(delta.x) / 64.0;
        }

        if (FT_Load_Glyph(face, index, FT_LOAD_DEFAULT) != 0) {
            err = "failed to load glyph for codepoint " + std::to_string(static_cast<unsigned long>(text[i]));
            return false;
        }
        FT_GlyphSlot slot = face->glyph;
        if (embolden > 0 && slot->format == FT_GLYPH_FORMAT_OUTLINE) {
            FT_Outline_Embolden(&slot->outline, embolden);
        }
        if (slot->format != FT_GLYPH_FORMAT_BITMAP && FT_Render_Glyph(slot, FT_RENDER_MODE_NORMAL) != 0) {
            err = "failed to render glyph for codepoint " + std::to_string(static_cast<unsigned long>(text[i]));
            return false;
        }

        placed_glyph g;
        copy_coverage(slot->bitmap, g);
        g.left = slot->bitmap_left;
        g.top = slot->bitmap_top;
        g.pen_x = static_cast<int>(std::lround(pen));
        out.push_back(std::move(g));

        pen += static_cast<double>(slot->advance.x + embolden) / 64.0;
        if (i + 1 < text.size()) pen += letter_spacing_px;
        previous = index;
    }
    line_width = static_cast<int>(std::lround(pen));
    return true;
}

/// \brief stamp_glyph.
void stamp_glyph(std::vector<float>& mask, int mask_w, int mask_h, const placed_glyph& g, int origin_x, int origin_y, ink_bounds& ink) {
    for (int y = 0; y < g.rows; ++y) {
        const int yy = origin_y + y;
        if (yy < 0 || yy >= mask_h) continue;
        for (int x = 0; x < g.width; ++x) {
            const int xx = origin_x + x;
            if (xx < 0 || xx >= mask_w) continue;
            const std::uint8_t c = g.coverage[static_cast<std::size_t>(y) * static_cast<std::size_t>(g.width) + static_cast<std::size_t>(x)];
            if (c == 0) continue;
            float& m = mask[static_cast<std::size_t>(yy) * static_cast<std::size_t>(mask_w) + static_cast<std::size_t>(xx)];
            m = std::max(m, c / 255.0f);
            ink.left = std::min(ink.left, xx);
            ink.right = std::max(ink.right, xx);
            ink.top = std::min(ink.top, yy);
            ink.bottom = std::max(ink.bottom, yy);
        }
    }
}

/// \brief tinted_layer.
raster_image tinted_layer(const std::vector<float>& plane, int width, int height, rgba8 color) {
    raster_image layer(width, height);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            const float a = plane[static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x)];
            if (a <= 0.0f) continue;
            const int alpha = static_cast<int>(std::lround(std::min(1.0f, a) * color.a));
            layer.set(x, y, {color.r, color.g, color.b, static_cast<std::uint8_t>(alpha)});
        }
    }
    return layer;
}

} // namespace

/// \brief caption_renderer::blur.
void caption_renderer::blur(std::vector<float>& plane, int width, int height, double sigma) {
    if (sigma <= 0.0 || width <= 0 || height <= 0) return;

    const int radius = static_cast<int>(std::ceil(sigma * 3.0));
    std::vector<float> kernel(static_cast<std::size_t>(radius * 2 + 1));
    float sum = 0.0f;
    for (int i = -radius; i <= radius; ++i) {
        const float v = static_cast<float>(std::exp(-(i * i) / (2.0 * sigma * sigma)));
        kernel[static_cast<std::size_t>(i + radius)] = v;
        sum += v;
    }
    for (auto& k : kernel) k /= sum;

    std::vector<float> tmp(plane.size(), 0.0f);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            float acc = 0.0f;
            for (int k = -radius; k <= radius; ++k) {
                const int xx = x + k;
                if (xx < 0 || xx >= width) continue;
                acc += plane[static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(xx)] * kernel[static_cast<std::size_t>(k + radius)];
            }
            tmp[static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x)] = acc;
        }
    }
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            float acc = 0.0f;
            for (int k = -radius; k <= radius; ++k) {
                const int yy = y + k;
                if (yy < 0 || yy >= height) continue;
                acc += tmp[static_cast<std::size_t>(yy) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x)] * kernel[static_cast<std::size_t>(k + radius)];
            }
            plane[static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x)] = acc;
        }
    }
}

/// \brief caption_renderer::render.
bool caption_renderer::render(raster_image& canvas, const caption_layout& layout, std::string& err) {
    if (canvas.empty()) {
        err = "caption canvas is empty";
        return false;
    }
    const auto fill = parse_hex_rgb(layout.style.fill);
    if (!fill) {
        err = "invalid caption fill color: " + layout.style.fill;
        return false;
    }

    ft_session ft;
    if (FT_Init_FreeType(&ft.library) != 0) {
        err = "failed to initialize FreeType";
        return false;
    }
    const std::string font_path = layout.style.font_path.string();
    if (FT_New_Face(ft.library, font_path.c_str(), 0, &ft.face) != 0) {
        err = "failed to open caption font: " + font_path;
        return false;
    }
    if (FT_Set_Pixel_Sizes(ft.face, 0, static_cast<FT_UInt>(layout.style.font_size)) != 0) {
        err = "failed to set caption font size " + std::to_string(layout.style.font_size);
        return false;
    }

    // synthetic bold when a heavy weight is requested from a regular face
    FT_Pos embolden = 0;
    if (layout.style.font_weight >= 600 && !(ft.face->style_flags & FT_STYLE_FLAG_BOLD)) {
        embolden = FT_MulFix(ft.face->units_per_EM, ft.face->size->metrics.y_scale) / 24;
    }
    const double letter_spacing_px = layout.style.letter_spacing_em * layout.style.font_size;

    std::vector<float> mask(static_cast<std::size_t>(canvas.width) * static_cast<std::size_t>(canvas.height), 0.0f);
    ink_bounds ink;
    std::vector<placed_glyph> glyphs;
    for (const auto& line : layout.lines) {
        int line_width = 0;
        if (!rasterize_line(ft.face, utf8::decode(line.text), letter_spacing_px, embolden, glyphs, line_width, err)) return false;

        const int start_x = layout.style.anchor_x - line_width / 2;
        const int baseline = static_cast<int>(std::lround(line.baseline_y));
        for (const auto& g : glyphs) {
            stamp_glyph(mask, canvas.width, canvas.height, g, start_x + g.pen_x + g.left, baseline - g.top, ink);
        }
    }
    if (ink.empty()) return true; // whitespace-only caption

    const int pad = static_cast<int>(std::ceil(k_shadow_sigma * 3.0)) + std::max(std::abs(k_shadow_dx), std::abs(k_shadow_dy)) + 1;
    const rect_i work = clip_rect(
        {ink.left - pad, ink.top - pad, ink.right - ink.left + 1 + pad * 2, ink.bottom - ink.top + 1 + pad * 2},
        {0, 0, canvas.width, canvas.height}
    );

    std::vector<float> text_plane(static_cast<std::size_t>(work.width) * static_cast<std::size_t>(work.height), 0.0f);
    std::vector<float> shadow_plane(text_plane.size(), 0.0f);
    for (int y = 0; y < work.height; ++y) {
        for (int x = 0; x < work.width; ++x) {
            const float m = mask[static_cast<std::size_t>(work.y + y) * static_cast<std::size_t>(canvas.width) + static_cast<std::size_t>(work.x + x)];
            text_plane[static_cast<std::size_t>(y) * static_cast<std::size_t>(work.width) + static_cast<std::size_t>(x)] = m;
            const int sx = x + k_shadow_dx;
            const int sy = y + k_shadow_dy;
            if (sx >= 0 && sx < work.width && sy >= 0 && sy < work.height) {
                shadow_plane[static_cast<std::size_t>(sy) * static_cast<std::size_t>(work.width) + static_cast<std::size_t>(sx)] = m;
            }
        }
    }
    blur(shadow_plane, work.width, work.height, k_shadow_sigma);

    raster_ops::composite_over(canvas, tinted_layer(shadow_plane, work.width, work.height, layout.shadow.color), work.x, work.y);
    raster_ops::composite_over(canvas, tinted_layer(text_plane, work.width, work.height, {(*fill)[0], (*fill)[1], (*fill)[2], 255}), work.x, work.y);
    return true;
}
