/// \file
/// \brief Caption wrapping with soft-hyphen support and SVG markup generation.
///
/// This source file implements one part of the storyframe composition engine. The wrapped lines
/// feed both the markup document and the FreeType caption renderer.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#include "storyframe/text_layout.h"
#include "storyframe/parse_util.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace {

/// \brief is_space.
inline bool is_space(char32_t c) {
    return c == U' ' || c == U'\t' || c == U'\n' || c == U'\r' || c == U'\f' || c == U'\v' || c == U'\u00A0';
}

/// \brief split_words.
std::vector<std::u32string> split_words(const std::u32string& text) {
    std::vector<std::u32string> words;
    std::u32string cur;
    for (const char32_t c : text) {
        if (is_space(c)) {
            if (!cur.empty()) words.push_back(std::move(cur));
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) words.push_back(std::move(cur));
    return words;
}

/// Pieces placed without a separating space. Every soft-hyphen segment but the last carries a
/// visible hyphen.
std::vector<std::u32string> word_pieces(const std::u32string& word) {
    std::vector<std::u32string> segments;
    std::u32string cur;
    for (const char32_t c : word) {
        if (c == text_layout::k_soft_hyphen) {
            segments.push_back(std::move(cur));
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    segments.push_back(std::move(cur));

    std::vector<std::u32string> pieces;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (segments[i].empty()) continue;
        std::u32string piece = segments[i];
        if (i + 1 < segments.size()) piece.push_back(U'-');
        pieces.push_back(std::move(piece));
    }
    return pieces;
}

class line_filler {
public:
    explicit line_filler(std::size_t budget) : budget_(budget) {}

    /// Returns false once the line cap is reached; nothing more can be placed.
    bool place(const std::u32string& piece, bool starts_word) {
        const std::size_t sep = (starts_word && !current_.empty()) ? 1 : 0;
        if (current_.size() + sep + piece.size() <= budget_) {
            if (sep) current_.push_back(U' ');
            current_ += piece;
            return true;
        }
        if (piece.size() <= budget_) {
            if (!close_line()) return false;
            current_ = piece;
            return true;
        }

        // longer than a whole line on its own: hard split into budget-sized chunks
        if (!close_line()) return false;
        for (std::size_t pos = 0; pos < piece.size(); pos += budget_) {
            if (!close_line()) return false;
            current_ = piece.substr(pos, budget_);
        }
        return true;
    }

    std::vector<std::string> finish() {
        if (!current_.empty() && lines_.size() < text_layout::k_max_lines) lines_.push_back(std::move(current_));
        current_.clear();

        std::vector<std::string> out;
        for (const auto& l : lines_) out.push_back(utf8::encode(l));
        if (out.empty()) out.emplace_back();
        return out;
    }

private:
    bool close_line() {
        if (!current_.empty()) {
            lines_.push_back(std::move(current_));
            current_.clear();
        }
        return lines_.size() < text_layout::k_max_lines;
    }

    std::size_t budget_;
    std::vector<std::u32string> lines_;
    std::u32string current_;
};

/// \brief fmt_num.
std::string fmt_num(double v) {
    std::ostringstream ss;
    ss << v;
    return ss.str();
}

/// \brief font_format.
std::string font_format(const std::filesystem::path& p) {
    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".otf") return "opentype";
    if (ext == ".woff2") return "woff2";
    if (ext == ".woff") return "woff";
    return "truetype";
}

/// \brief font_url.
std::string font_url(const std::filesystem::path& p) {
    std::error_code ec;
    std::filesystem::path abs = std::filesystem::absolute(p, ec);
    if (ec) abs = p;
    return "file://" + abs.generic_string();
}

} // namespace

namespace utf8 {

std::u32string decode(std::string_view s) {
    std::u32string out;
    out.reserve(s.size());
    std::size_t i = 0;
    while (i < s.size()) {
        const auto b0 = static_cast<unsigned char>(s[i]);
        int extra = 0;
        char32_t cp = 0;
        if (b0 < 0x80) {
            cp = b0;
        } else if ((b0 & 0xE0) == 0xC0) {
            cp = b0 & 0x1F;
            extra = 1;
        } else if ((b0 & 0xF0) == 0xE0) {
            cp = b0 & 0x0F;
            extra = 2;
        } else if ((b0 & 0xF8) == 0xF0) {
            cp = b0 & 0x07;
            extra = 3;
        } else {
            out.push_back(U'\uFFFD');
            ++i;
            continue;
        }

        if (extra > 0 && i + static_cast<std::size_t>(extra) >= s.size()) {
            // truncated sequence at the end of input
            out.push_back(U'\uFFFD');
            break;
        }
        bool ok = true;
        for (int k = 1; k <= extra; ++k) {
            const auto bk = static_cast<unsigned char>(s[i + static_cast<std::size_t>(k)]);
            if ((bk & 0xC0) != 0x80) {
                ok = false;
                break;
            }
            cp = (cp << 6) | (bk & 0x3F);
        }
        if (!ok) {
            out.push_back(U'\uFFFD');
            ++i;
            continue;
        }
        out.push_back(cp);
        i += static_cast<std::size_t>(extra) + 1;
    }
    return out;
}

std::string encode(std::u32string_view s) {
    std::string out;
    out.reserve(s.size());
    for (const char32_t cp : s) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }
    return out;
}

} // namespace utf8

/// \brief text_layout::chars_per_line.
int text_layout::chars_per_line(int max_width, int font_size, double glyph_width_factor) {
    if (max_width <= 0 || font_size <= 0 || glyph_width_factor <= 0.0) return 1;
    const double budget = std::floor((static_cast<double>(max_width) / font_size) / glyph_width_factor);
    return std::max(1, static_cast<int>(budget));
}

/// \brief text_layout::wrap.
std::vector<std::string> text_layout::wrap(std::string_view text, int max_chars) {
    line_filler filler(static_cast<std::size_t>(std::max(1, max_chars)));

    for (const auto& word : split_words(utf8::decode(text))) {
        bool first = true;
        for (const auto& piece : word_pieces(word)) {
            if (!filler.place(piece, first)) return filler.finish();
            first = false;
        }
    }
    return filler.finish();
}

/// \brief text_layout::escape_xml.
std::string text_layout::escape_xml(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (const char c : text) {
        switch (c) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&quot;"; break;
        case '\'': out += "&apos;"; break;
        default: out.push_back(c); break;
        }
    }
    return out;
}

/// \brief text_layout::caption_box.
rect_i text_layout::caption_box(const caption_style& style, int y) {
    const int height = static_cast<int>(std::lround(static_cast<double>(k_max_lines) * style.line_height_factor * style.font_size));
    const rect_i box{style.anchor_x - style.max_width / 2, y - style.font_size, style.max_width, height};
    return clip_rect(box, story_canvas::bounds());
}

/// \brief text_layout::build.
bool text_layout::build(
    std::string_view text,
    const caption_style& style,
    int y,
    const shadow_style& shadow,
    caption_layout& out,
    std::string& err
) {
    if (style.font_size <= 0) {
        err = "caption font size must be positive";
        return false;
    }
    if (style.max_width <= 0) {
        err = "caption max width must be positive";
        return false;
    }
    if (!parse_hex_rgb(style.fill)) {
        err = "caption fill must be #RRGGBB, got '" + style.fill + "'";
        return false;
    }

    out = {};
    out.style = style;
    out.shadow = shadow;
    out.y = y;
    out.line_height = style.font_size * style.line_height_factor;

    const auto lines = wrap(text, chars_per_line(style.max_width, style.font_size, style.glyph_width_factor));
    for (std::size_t i = 0; i < lines.size(); ++i) {
        out.lines.push_back({lines[i], y + out.line_height * static_cast<double>(i)});
    }

    const std::string family = escape_xml(style.font_family);
    const std::string x = std::to_string(style.anchor_x);

    std::ostringstream svg;
    svg << "<svg width=\"" << story_canvas::width << "\" height=\"" << story_canvas::height
        << "\" xmlns=\"http://www.w3.org/2000/svg\">\n"
        << "  <defs>\n"
        << "    <style type=\"text/css\">\n"
        << "      @font-face {\n"
        << "        font-family: '" << family << "';\n"
        << "        src: url('" << escape_xml(font_url(style.font_path)) << "') format('" << font_format(style.font_path) << "');\n"
        << "        font-weight: 100 1000;\n"
        << "      }\n"
        << "    </style>\n"
        << "    <filter id=\"captionShadow\">\n"
        << "      <feDropShadow dx=\"0\" dy=\"2\" stdDeviation=\"4\" flood-color=\"" << escape_xml(shadow.css_color) << "\"/>\n"
        << "    </filter>\n"
        << "  </defs>\n"
        << "  <text x=\"" << x << "\" y=\"" << y << "\" font-family=\"" << family << "\" font-size=\"" << style.font_size
        << "\" font-weight=\"" << style.font_weight << "\" fill=\"" << escape_xml(style.fill)
        << "\" text-anchor=\"middle\" letter-spacing=\"" << fmt_num(style.letter_spacing_em)
        << "em\" filter=\"url(#captionShadow)\">\n";
    for (std::size_t i = 0; i < out.lines.size(); ++i) {
        const double dy = (i == 0) ? 0.0 : out.line_height;
        svg << "    <tspan x=\"" << x << "\" dy=\"" << fmt_num(dy) << "\">" << escape_xml(out.lines[i].text) << "</tspan>\n";
    }
    svg << "  </text>\n"
        << "</svg>\n";
    out.markup = svg.str();
    return true;
}
