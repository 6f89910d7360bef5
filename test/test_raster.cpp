/// \file
/// \brief Unit tests for raster buffers, resize fit modes and story canvas compositing.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#include <gtest/gtest.h>

#include <fstream>

#include "storyframe/raster_compositor.h"
#include "storyframe/raster_image.h"
#include "test_support.h"

using test_support::channel_distance;
using test_support::scratch_dir;

namespace {

const rgba8 red{255, 0, 0, 255};
const rgba8 blue{0, 0, 255, 255};
const rgba8 green{0, 200, 0, 255};

} // namespace

TEST(raster_ops, cover_crops_center_without_letterbox) {
    raster_image src(200, 100, red);
    src.fill_rect({100, 0, 100, 100}, blue);

    raster_image out;
    std::string err;
    ASSERT_TRUE(raster_ops::resize(src, 100, 100, fit_mode::cover, out, err)) << err;
    EXPECT_EQ(out.width, 100);
    EXPECT_EQ(out.height, 100);

    EXPECT_LE(channel_distance(out.at(10, 50), red), 6);
    EXPECT_LE(channel_distance(out.at(90, 50), blue), 6);
    for (int y = 0; y < out.height; y += 9) {
        EXPECT_EQ(out.at(0, y).a, 255);
        EXPECT_EQ(out.at(99, y).a, 255);
    }
}

TEST(raster_ops, contain_pads_with_transparency) {
    const raster_image src(200, 100, red);

    raster_image out;
    std::string err;
    ASSERT_TRUE(raster_ops::resize(src, 100, 100, fit_mode::contain, out, err)) << err;
    EXPECT_EQ(out.width, 100);
    EXPECT_EQ(out.height, 100);

    EXPECT_EQ(out.at(50, 5).a, 0);
    EXPECT_EQ(out.at(50, 95).a, 0);
    EXPECT_EQ(out.at(50, 50).a, 255);
    EXPECT_LE(channel_distance(out.at(50, 50), red), 3);
}

TEST(raster_ops, resize_rejects_bad_input) {
    raster_image out;
    std::string err;
    EXPECT_FALSE(raster_ops::resize(raster_image{}, 10, 10, fit_mode::cover, out, err));
    EXPECT_FALSE(err.empty());

    err.clear();
    EXPECT_FALSE(raster_ops::resize(raster_image(4, 4, red), 0, 10, fit_mode::contain, out, err));
    EXPECT_FALSE(err.empty());
}

TEST(raster_ops, extract_requires_region_inside_image) {
    raster_image src(50, 40, blue);
    src.set(12, 7, red);

    raster_image out;
    std::string err;
    ASSERT_TRUE(raster_ops::extract(src, {10, 5, 20, 10}, out, err)) << err;
    EXPECT_EQ(out.width, 20);
    EXPECT_EQ(out.height, 10);
    EXPECT_EQ(out.at(2, 2).r, 255);
    EXPECT_EQ(out.at(0, 0).b, 255);

    EXPECT_FALSE(raster_ops::extract(src, {40, 30, 20, 20}, out, err));
    EXPECT_FALSE(raster_ops::extract(src, {0, 0, 0, 5}, out, err));
}

TEST(raster_ops, composite_over_blends_straight_alpha) {
    raster_image base(4, 4, {0, 0, 0, 255});
    raster_image layer(2, 2, {255, 255, 255, 128});
    layer.set(1, 1, {0, 0, 0, 0});

    raster_ops::composite_over(base, layer, 3, 3); // partially off-canvas
    EXPECT_EQ(base.at(3, 3).r, 128);
    EXPECT_EQ(base.at(3, 3).a, 255);
    EXPECT_EQ(base.at(2, 2).r, 0);

    raster_ops::composite_over(base, raster_image(1, 1, green), 0, 0);
    EXPECT_EQ(base.at(0, 0).g, 200);
}

TEST(raster_io, png_round_trip_and_decode_errors) {
    scratch_dir dir("raster_io");
    raster_image img(3, 2, green);
    img.set(2, 1, red);

    std::string err;
    ASSERT_TRUE(raster_io::save_png(dir.file("a.png"), img, err)) << err;
    raster_image back;
    ASSERT_TRUE(raster_io::load(dir.file("a.png"), back, err)) << err;
    EXPECT_EQ(back.width, 3);
    EXPECT_EQ(back.height, 2);
    EXPECT_EQ(back.pixels, img.pixels);

    {
        std::ofstream f(dir.file("broken.png"), std::ios::binary);
        f << "not an image";
    }
    err.clear();
    EXPECT_FALSE(raster_io::load(dir.file("broken.png"), back, err));
    EXPECT_NE(err.find("broken.png"), std::string::npos);

    err.clear();
    EXPECT_FALSE(raster_io::save_png(dir.file("missing/out.png"), img, err));
    EXPECT_FALSE(err.empty());
}

TEST(raster_compositor, validation_distinguishes_missing_and_unsupported) {
    scratch_dir dir("validate");
    test_support::write_png(dir.file("bg.png"), raster_image(4, 4, blue));
    {
        std::ofstream f(dir.file("anim.gif"), std::ios::binary);
        f << "GIF89a";
    }

    EXPECT_NO_THROW(raster_compositor::validate_input(dir.file("bg.png"), "background"));

    try {
        raster_compositor::validate_input(dir.file("nope.png"), "background");
        FAIL() << "expected composition_error";
    } catch (const composition_error& e) {
        EXPECT_EQ(e.kind(), composition_error_kind::file_not_found);
        EXPECT_NE(std::string(e.what()).find("Background file not found"), std::string::npos);
    }

    try {
        raster_compositor::validate_input(dir.file("anim.gif"), "asset");
        FAIL() << "expected composition_error";
    } catch (const composition_error& e) {
        EXPECT_EQ(e.kind(), composition_error_kind::unsupported_format);
        EXPECT_NE(std::string(e.what()).find(".gif"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find(".png, .jpg, .jpeg"), std::string::npos);
    }

    EXPECT_TRUE(raster_compositor::is_supported_extension("PHOTO.JPG"));
    EXPECT_TRUE(raster_compositor::is_supported_extension("a.jpeg"));
    EXPECT_FALSE(raster_compositor::is_supported_extension("a.webp"));
    EXPECT_FALSE(raster_compositor::is_supported_extension("noext"));
}

TEST(raster_compositor, layers_centered_asset_on_cover_background) {
    scratch_dir dir("compose");
    test_support::write_jpg(dir.file("bg.jpg"), raster_image(540, 960, blue));
    test_support::write_png(dir.file("asset.png"), raster_image(1200, 800, red));

    raster_image canvas;
    scaled_placement placement;
    std::string err;
    ASSERT_TRUE(raster_compositor::compose(dir.file("bg.jpg"), dir.file("asset.png"), canvas, placement, err)) << err;

    EXPECT_EQ(canvas.width, 1080);
    EXPECT_EQ(canvas.height, 1920);
    EXPECT_EQ(placement.rect(), (rect_i{162, 708, 756, 504}));

    EXPECT_LE(channel_distance(canvas.at(540, 960), red), 6);
    EXPECT_LE(channel_distance(canvas.at(540, 400), blue), 20); // jpeg
    EXPECT_LE(channel_distance(canvas.at(50, 1800), blue), 20);
    EXPECT_EQ(canvas.at(540, 400).a, 255);
}

TEST(raster_compositor, compose_to_file_writes_canvas_png) {
    scratch_dir dir("compose_file");
    test_support::write_png(dir.file("bg.png"), raster_image(100, 100, green));
    test_support::write_png(dir.file("asset.png"), raster_image(60, 100, red));

    std::string err;
    ASSERT_TRUE(raster_compositor::compose_to_file(dir.file("bg.png"), dir.file("asset.png"), dir.file("out.jpg"), err)) << err;

    // extension is ignored: the file is PNG
    std::ifstream f(dir.file("out.jpg"), std::ios::binary);
    char sig[8] = {};
    f.read(sig, 8);
    EXPECT_EQ(static_cast<unsigned char>(sig[0]), 0x89);
    EXPECT_EQ(std::string(sig + 1, 3), "PNG");

    const raster_image out = test_support::load(dir.file("out.jpg"));
    EXPECT_EQ(out.width, 1080);
    EXPECT_EQ(out.height, 1920);
}
