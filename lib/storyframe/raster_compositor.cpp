/// \file
/// \brief Story canvas compositing: cover-fit background, contain-fit centered asset.
///
/// This source file implements one part of the storyframe composition engine. It produces the
/// flattened canvas every caption stage works on.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#include "storyframe/raster_compositor.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>
#include <system_error>

namespace {

constexpr std::array<std::string_view, 3> k_supported_extensions = {".png", ".jpg", ".jpeg"};

/// \brief lower_extension.
std::string lower_extension(const std::filesystem::path& p) {
    std::string e = p.extension().string();
    std::transform(e.begin(), e.end(), e.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return e;
}

/// \brief supported_list.
std::string supported_list() {
    std::string out;
    for (const auto ext : k_supported_extensions) {
        if (!out.empty()) out += ", ";
        out += ext;
    }
    return out;
}

} // namespace

/// \brief raster_compositor::is_supported_extension.
bool raster_compositor::is_supported_extension(const std::filesystem::path& path) {
    const std::string ext = lower_extension(path);
    return std::find(k_supported_extensions.begin(), k_supported_extensions.end(), ext) != k_supported_extensions.end();
}

/// \brief raster_compositor::validate_input.
void raster_compositor::validate_input(const std::filesystem::path& path, const std::string& role) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        std::string label = role;
        if (!label.empty()) label[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(label[0])));
        throw composition_error(composition_error_kind::file_not_found, label + " file not found: " + path.string());
    }
    if (!is_supported_extension(path)) {
        const std::string ext = lower_extension(path);
        throw composition_error(
            composition_error_kind::unsupported_format,
            "Unsupported " + role + " format: " + (ext.empty() ? std::string("(none)") : ext)
                + ". Supported formats: " + supported_list()
        );
    }
}

/// \brief raster_compositor::compose.
bool raster_compositor::compose(
    const std::filesystem::path& background_path,
    const std::filesystem::path& asset_path,
    raster_image& canvas,
    scaled_placement& placement,
    std::string& err
) {
    raster_image background;
    if (!raster_io::load(background_path, background, err)) return false;
    if (!raster_ops::resize(background, story_canvas::width, story_canvas::height, fit_mode::cover, canvas, err)) return false;

    raster_image asset;
    if (!raster_io::load(asset_path, asset, err)) return false;

    placement = asset_scaler::fit(asset.width, asset.height);
    raster_image scaled_asset;
    if (!raster_ops::resize(asset, placement.width, placement.height, fit_mode::contain, scaled_asset, err)) return false;

    raster_ops::composite_over(canvas, scaled_asset, placement.x, placement.y);

    // the story canvas is always opaque
    for (std::size_t i = 3; i < canvas.pixels.size(); i += 4) canvas.pixels[i] = 255;
    return true;
}

/// \brief raster_compositor::compose_to_file.
bool raster_compositor::compose_to_file(
    const std::filesystem::path& background_path,
    const std::filesystem::path& asset_path,
    const std::filesystem::path& output_path,
    std::string& err
) {
    raster_image canvas;
    scaled_placement placement;
    if (!compose(background_path, asset_path, canvas, placement, err)) return false;
    return raster_io::save_png(output_path, canvas, err);
}
