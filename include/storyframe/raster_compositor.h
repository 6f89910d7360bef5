/// \file
/// \brief Background cover-fit plus centered asset layering into one story canvas.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

#include "storyframe/asset_scaler.h"
#include "storyframe/raster_image.h"

enum class composition_error_kind {
    file_not_found,
    unsupported_format
};

/// Thrown for caller-visible validation failures only; processing failures are returned.
class composition_error : public std::runtime_error {
public:
    composition_error(composition_error_kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] composition_error_kind kind() const noexcept { return kind_; }

private:
    composition_error_kind kind_;
};

class raster_compositor {
public:
    /// Input extensions accepted without looking at file content.
    static bool is_supported_extension(const std::filesystem::path& path);

    /// Throws composition_error when \p path is missing or has a non-allow-listed extension.
    /// \p role names the input ("background", "asset") in the message.
    static void validate_input(const std::filesystem::path& path, const std::string& role);

    /// Build the flattened canvas in memory. \p placement receives the asset placement.
    static bool compose(
        const std::filesystem::path& background_path,
        const std::filesystem::path& asset_path,
        raster_image& canvas,
        scaled_placement& placement,
        std::string& err
    );

    /// compose() followed by encoding the canvas to \p output_path as PNG.
    static bool compose_to_file(
        const std::filesystem::path& background_path,
        const std::filesystem::path& asset_path,
        const std::filesystem::path& output_path,
        std::string& err
    );
};

/// The flattening step story_composer runs before any caption work.
class composite_stage {
public:
    virtual ~composite_stage() = default;

    virtual bool build(
        const std::filesystem::path& background_path,
        const std::filesystem::path& asset_path,
        raster_image& canvas,
        scaled_placement& placement,
        std::string& err
    ) const = 0;
};

/// raster_compositor::compose behind the composite_stage interface.
class raster_composite_stage : public composite_stage {
public:
    bool build(
        const std::filesystem::path& background_path,
        const std::filesystem::path& asset_path,
        raster_image& canvas,
        scaled_placement& placement,
        std::string& err
    ) const override {
        return raster_compositor::compose(background_path, asset_path, canvas, placement, err);
    }
};
