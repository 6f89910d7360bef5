/// \file
/// \brief Composition orchestration with caption retry, silent fallback and temp cleanup.
///
/// This source file implements one part of the storyframe composition engine. A call moves
/// through validating, compositing, captioning and finalizing; only validation throws.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#include "storyframe/composer.h"
#include "storyframe/caption_renderer.h"

#include <chrono>
#include <exception>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>

namespace {

using clock_type = std::chrono::steady_clock;

/// \brief elapsed_ms.
long long elapsed_ms(clock_type::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(clock_type::now() - since).count();
}

/// \brief copy_over.
bool copy_over(const std::filesystem::path& from, const std::filesystem::path& to, std::string& err) {
    std::error_code ec;
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        err = "failed to write " + to.string() + ": " + ec.message();
        return false;
    }
    return true;
}

} // namespace

story_composer::story_composer(
    composer_config config,
    std::unique_ptr<bottom_edge_detector> detector,
    std::unique_ptr<composite_stage> stage
)
    : config_(std::move(config)), detector_(std::move(detector)), stage_(std::move(stage)) {
    if (!detector_) detector_ = std::make_unique<variance_edge_detector>();
    if (!stage_) stage_ = std::make_unique<raster_composite_stage>();
}

std::filesystem::path story_composer::temp_path_for(const std::filesystem::path& output_path) const {
    return std::filesystem::path(output_path.string() + config_.temp_suffix);
}

void story_composer::log(const std::string& line) const {
    if (!config_.quiet) std::cout << "[compose] " << line << "\n";
}

void story_composer::remove_temp(const std::filesystem::path& temp) const {
    std::error_code ec;
    std::filesystem::remove(temp, ec);
    if (ec) std::cerr << "warning: could not remove temporary file " << temp.string() << ": " << ec.message() << "\n";
}

/// \brief story_composer::composite_to_temp.
bool story_composer::composite_to_temp(
    const composition_request& request,
    const std::filesystem::path& temp,
    raster_image& composite,
    std::string& err
) const {
    try {
        scaled_placement placement;
        if (!stage_->build(request.background_path, request.asset_path, composite, placement, err)) return false;
        if (!raster_io::save_png(temp, composite, err)) return false;
        log("composited " + request.background_path.filename().string() + " + " + request.asset_path.filename().string() +
            " (asset " + std::to_string(placement.width) + "x" + std::to_string(placement.height) + " at " +
            std::to_string(placement.x) + "," + std::to_string(placement.y) + ")");
        return true;
    } catch (const std::exception& e) {
        err = std::string("compositing threw: ") + e.what();
        return false;
    }
}

/// \brief story_composer::render_caption.
bool story_composer::render_caption(
    const raster_image& composite,
    const caption_attempt& attempt,
    const std::filesystem::path& output_path,
    text_overlay_analytics& analytics,
    std::string& markup,
    std::string& err
) const {
    try {
        const caption_tier tier = attempt.tier ? *attempt.tier : caption_tiers::from_edge(detector_->detect_bottom_edge(composite));
        const rect_i box = text_layout::caption_box(config_.style, tier.y);
        const brightness_sample bs = brightness_sampler::sample(composite, box);
        const shadow_style shadow = shadow_selector::select(bs.average);

        analytics.tier = tier.tier;
        analytics.position_y = tier.y;
        analytics.avg_brightness = bs.average;
        analytics.brightness_samples = bs.samples;
        analytics.shadow = shadow.variant;

        caption_layout layout;
        if (!text_layout::build(attempt.text, config_.style, tier.y, shadow, layout, err)) return false;
        analytics.lines_count = static_cast<int>(layout.lines.size());

        raster_image captioned = composite;
        if (!caption_renderer::render(captioned, layout, err)) return false;
        if (!raster_io::save_png(output_path, captioned, err)) return false;

        markup = std::move(layout.markup);
        return true;
    } catch (const std::exception& e) {
        err = std::string("caption rendering threw: ") + e.what();
        return false;
    }
}

/// \brief story_composer::compose.
composition_result story_composer::compose(const composition_request& request) const {
    // validating: the only stage allowed to throw
    raster_compositor::validate_input(request.background_path, "background");
    raster_compositor::validate_input(request.asset_path, "asset");

    composition_result result;
    result.output_path = request.output_path;
    text_overlay_analytics& analytics = result.analytics;
    analytics.enabled = request.include_caption;

    const std::filesystem::path temp = temp_path_for(request.output_path);

    // compositing
    raster_image composite;
    std::string err;
    if (!composite_to_temp(request, temp, composite, err)) {
        std::cerr << "error: composition failed for " << request.output_path.string() << ": " << err << "\n";
        analytics.error = err;
        remove_temp(temp);
        return result;
    }

    if (!request.include_caption) {
        // finalizing without caption
        if (!copy_over(temp, request.output_path, err)) {
            std::cerr << "error: " << err << "\n";
            analytics.error = err;
            remove_temp(temp);
            return result;
        }
        remove_temp(temp);
        result.success = true;
        log("wrote " + request.output_path.string());
        return result;
    }

    // captioning
    const auto started = clock_type::now();
    const caption_attempt first{request.caption_override.value_or(config_.default_caption), std::nullopt};

    bool captioned = render_caption(composite, first, request.output_path, analytics, result.caption_markup, err);
    if (!captioned) {
        std::cerr << "warning: caption failed (" << err << "), retrying with defaults\n";
        analytics.retry_count = 1;
        const caption_attempt retry{config_.default_caption, caption_tiers::fallback()};
        captioned = render_caption(composite, retry, request.output_path, analytics, result.caption_markup, err);
    }

    if (!captioned) {
        std::cerr << "warning: caption retry failed (" << err << "), writing uncaptioned composite\n";
        analytics.failed = true;
        analytics.fallback_applied = true;
        analytics.error = err;
        result.caption_markup.clear();
        std::string copy_err;
        if (!copy_over(temp, request.output_path, copy_err)) {
            std::cerr << "error: " << copy_err << "\n";
            analytics.error = copy_err;
            analytics.render_time_ms = elapsed_ms(started);
            remove_temp(temp);
            return result;
        }
    }
    analytics.render_time_ms = elapsed_ms(started);

    // finalizing
    remove_temp(temp);
    result.success = true;
    log("wrote " + request.output_path.string() + " (caption tier " + std::to_string(analytics.tier) +
        ", y=" + std::to_string(analytics.position_y) + ", " + to_string(analytics.shadow) + " shadow" +
        (analytics.fallback_applied ? ", fallback" : "") + ")");
    return result;
}

/// \brief story_composer::generate_preview.
preview_result story_composer::generate_preview(
    const std::filesystem::path& background_path,
    const std::filesystem::path& asset_path,
    const std::filesystem::path& output_path
) const {
    preview_result out;
    out.output_path = output_path;
    const auto started = clock_type::now();

    composition_request request;
    request.background_path = background_path;
    request.asset_path = asset_path;
    request.output_path = output_path;
    request.include_caption = false;

    try {
        composition_result r = compose(request);
        if (!r.success) {
            std::cerr << "warning: preview failed (" << r.analytics.error << "), retrying\n";
            r = compose(request);
        }
        out.success = r.success;
        out.error = r.analytics.error;
    } catch (const composition_error& e) {
        out.success = false;
        out.error = e.what();
    }

    out.generation_time_ms = elapsed_ms(started);
    return out;
}

/// \brief format_analytics.
std::string format_analytics(const text_overlay_analytics& a) {
    std::ostringstream ss;
    ss << "enabled: " << (a.enabled ? "true" : "false") << "\n";
    if (a.enabled) {
        ss << "tier: " << a.tier << "\n";
        ss << "position_y: " << a.position_y << "\n";
        ss << "shadow: " << to_string(a.shadow) << "\n";
        ss << "lines: " << a.lines_count << "\n";
        ss << "avg_brightness: " << a.avg_brightness << "\n";
        ss << "brightness_samples:";
        for (const int s : a.brightness_samples) ss << " " << s;
        ss << "\n";
        ss << "render_time_ms: " << a.render_time_ms << "\n";
        ss << "retry_count: " << a.retry_count << "\n";
        ss << "failed: " << (a.failed ? "true" : "false") << "\n";
        ss << "fallback_applied: " << (a.fallback_applied ? "true" : "false") << "\n";
    }
    if (!a.error.empty()) ss << "error: " << a.error << "\n";
    return ss.str();
}
