/// \file
/// \brief Story composition orchestrator: validate, composite, caption with retry, fall back.
///
/// This header declares the single call contract consumed by the workflow layer and the
/// preview/batch wrappers, together with the analytics it reports.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#pragma once

#include <array>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "storyframe/brightness_sampler.h"
#include "storyframe/caption_tiers.h"
#include "storyframe/edge_detector.h"
#include "storyframe/raster_compositor.h"
#include "storyframe/text_layout.h"

struct composer_config {
    std::string default_caption{"Get this exclusive premium asset for free (today only!) - link in bio"};
    caption_style style{};      // style.font_path is the caption font
    std::string temp_suffix{".tmp.png"};
    bool quiet{false};          // suppress [compose] progress lines
};

struct composition_request {
    std::filesystem::path background_path;
    std::filesystem::path asset_path;
    std::filesystem::path output_path;
    bool include_caption{true};
    std::optional<std::string> caption_override;
};

struct text_overlay_analytics {
    bool enabled{false};
    int tier{0};                 // 0 when no caption was attempted
    int position_y{0};
    shadow_variant shadow{shadow_variant::dark};
    int lines_count{0};
    double avg_brightness{0.0};
    std::array<int, 9> brightness_samples{};
    long long render_time_ms{0};
    int retry_count{0};
    bool failed{false};
    bool fallback_applied{false};
    std::string error;           // last failure message, empty on a clean run
};

struct composition_result {
    bool success{false};
    std::filesystem::path output_path;
    text_overlay_analytics analytics;
    std::string caption_markup;  // SVG of the caption that was rendered, if any
};

struct preview_result {
    bool success{false};
    std::filesystem::path output_path;
    long long generation_time_ms{0};
    std::string error;
};

class story_composer {
public:
    explicit story_composer(
        composer_config config = {},
        std::unique_ptr<bottom_edge_detector> detector = nullptr,
        std::unique_ptr<composite_stage> stage = nullptr
    );

    [[nodiscard]] const composer_config& config() const { return config_; }

    /// Throws composition_error for a missing or unsupported input. Every other failure,
    /// allocation failures included, is reported through the result; a caption failure never
    /// makes the result unsuccessful.
    composition_result compose(const composition_request& request) const;

    /// Uncaptioned composition retried once on an unsuccessful result.
    preview_result generate_preview(
        const std::filesystem::path& background_path,
        const std::filesystem::path& asset_path,
        const std::filesystem::path& output_path
    ) const;

    /// Temporary composite path for \p output_path.
    [[nodiscard]] std::filesystem::path temp_path_for(const std::filesystem::path& output_path) const;

private:
    struct caption_attempt {
        std::string text;
        std::optional<caption_tier> tier; // empty: place below the detected asset edge
    };

    bool render_caption(
        const raster_image& composite,
        const caption_attempt& attempt,
        const std::filesystem::path& output_path,
        text_overlay_analytics& analytics,
        std::string& markup,
        std::string& err
    ) const;

    bool composite_to_temp(
        const composition_request& request,
        const std::filesystem::path& temp,
        raster_image& composite,
        std::string& err
    ) const;

    void remove_temp(const std::filesystem::path& temp) const;
    void log(const std::string& line) const;

    composer_config config_;
    std::unique_ptr<bottom_edge_detector> detector_;
    std::unique_ptr<composite_stage> stage_;
};

/// Analytics as "key: value" lines.
std::string format_analytics(const text_overlay_analytics& a);
