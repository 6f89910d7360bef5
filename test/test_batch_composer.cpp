/// \file
/// \brief Tests for bounded batch composition and manifest parsing.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <sstream>
#include <thread>
#include <vector>

#include "storyframe/batch_composer.h"
#include "test_support.h"

using test_support::scratch_dir;

namespace {

composer_config quiet_config() {
    composer_config cfg;
    cfg.style.font_path = test_support::font_path();
    cfg.quiet = true;
    return cfg;
}

/// Holds each caller until a full wave has arrived (or a timeout passes) and records how many
/// detections had already finished when each one started.
class wave_tracking_detector : public bottom_edge_detector {
public:
    explicit wave_tracking_detector(int wave) : wave_(wave) {}

    int detect_bottom_edge(const raster_image&) const override {
        const int now = ++in_flight_;
        int seen = peak_.load();
        while (now > seen && !peak_.compare_exchange_weak(seen, now)) {}
        {
            std::lock_guard<std::mutex> lock(mu_);
            finished_at_start_.push_back(finished_.load());
        }

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(500);
        while (in_flight_.load() < wave_ && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }

        ++finished_;
        --in_flight_;
        return 0;
    }

    [[nodiscard]] int peak() const { return peak_.load(); }

    [[nodiscard]] std::vector<int> finished_at_start() const {
        std::lock_guard<std::mutex> lock(mu_);
        std::vector<int> out = finished_at_start_;
        std::sort(out.begin(), out.end());
        return out;
    }

private:
    int wave_;
    mutable std::atomic<int> in_flight_{0};
    mutable std::atomic<int> peak_{0};
    mutable std::atomic<int> finished_{0};
    mutable std::mutex mu_;
    mutable std::vector<int> finished_at_start_;
};

} // namespace

TEST(batch_composer, waves_are_bounded) {
    const story_composer c(quiet_config());
    const batch_composer five(c);
    EXPECT_EQ(five.concurrency(), 5u);
    EXPECT_EQ(five.waves_for(0), 0u);
    EXPECT_EQ(five.waves_for(5), 1u);
    EXPECT_EQ(five.waves_for(6), 2u);
    EXPECT_EQ(five.waves_for(12), 3u);

    const batch_composer clamped(c, 0);
    EXPECT_EQ(clamped.concurrency(), 1u);
    EXPECT_EQ(clamped.waves_for(3), 3u);
}

TEST(batch_composer, failures_stay_with_their_item) {
    scratch_dir dir("batch");
    test_support::write_png(dir.file("bg.png"), raster_image(90, 160, {20, 20, 60, 255}));
    test_support::write_jpg(dir.file("asset.jpg"), raster_image(300, 300, {240, 200, 10, 255}));

    std::vector<composition_request> requests;
    for (int i = 0; i < 7; ++i) {
        composition_request r;
        r.background_path = dir.file("bg.png");
        r.asset_path = dir.file("asset.jpg");
        r.output_path = dir.file("out" + std::to_string(i) + ".png");
        r.include_caption = (i % 2) == 0;
        requests.push_back(r);
    }
    requests[3].asset_path = dir.file("missing.png");            // validation error
    requests[5].output_path = dir.file("missing-dir/out5.png");  // processing error
    requests.push_back(requests[0]);                             // duplicate output

    const story_composer c(quiet_config());
    const batch_composer batch(c, 3);
    const auto outcomes = batch.run(requests);

    ASSERT_EQ(outcomes.size(), requests.size());
    for (const int ok : {0, 1, 2, 4, 6}) {
        SCOPED_TRACE(ok);
        EXPECT_TRUE(outcomes[ok].succeeded()) << outcomes[ok].error;
        EXPECT_TRUE(std::filesystem::exists(requests[ok].output_path));
        EXPECT_EQ(outcomes[ok].request.output_path, requests[ok].output_path);
    }

    EXPECT_FALSE(outcomes[3].succeeded());
    EXPECT_FALSE(outcomes[3].result.has_value());
    EXPECT_NE(outcomes[3].error.find("Asset file not found"), std::string::npos);

    EXPECT_FALSE(outcomes[5].succeeded());
    ASSERT_TRUE(outcomes[5].result.has_value());
    EXPECT_FALSE(outcomes[5].error.empty());

    EXPECT_FALSE(outcomes[7].succeeded());
    EXPECT_NE(outcomes[7].error.find("duplicate output path"), std::string::npos);

    EXPECT_TRUE(outcomes[0].result->analytics.enabled);
    EXPECT_FALSE(outcomes[1].result->analytics.enabled);
}

TEST(batch_composer, parses_manifest_lines) {
    std::istringstream in(
        "# background\tasset\toutput\n"
        "\n"
        "bg.jpg\tasset.png\tout/one.png\n"
        "bg.jpg\tasset.png\tout/two.png\toff\n"
        "bg.jpg\tasset.png\tout/three.png\ton\tLimited drop, 24h only\n"
    );

    std::vector<composition_request> requests;
    std::string err;
    ASSERT_TRUE(batch_composer::parse_manifest(in, requests, err)) << err;
    ASSERT_EQ(requests.size(), 3u);

    EXPECT_EQ(requests[0].background_path, std::filesystem::path("bg.jpg"));
    EXPECT_EQ(requests[0].asset_path, std::filesystem::path("asset.png"));
    EXPECT_EQ(requests[0].output_path, std::filesystem::path("out/one.png"));
    EXPECT_TRUE(requests[0].include_caption);
    EXPECT_FALSE(requests[0].caption_override.has_value());

    EXPECT_FALSE(requests[1].include_caption);

    EXPECT_TRUE(requests[2].include_caption);
    ASSERT_TRUE(requests[2].caption_override.has_value());
    EXPECT_EQ(*requests[2].caption_override, "Limited drop, 24h only");
}

TEST(batch_composer, rejects_malformed_manifest) {
    std::vector<composition_request> requests;
    std::string err;

    std::istringstream short_line("bg.jpg\tasset.png\n");
    EXPECT_FALSE(batch_composer::parse_manifest(short_line, requests, err));
    EXPECT_NE(err.find("line 1"), std::string::npos);

    std::istringstream empty_field("ok.jpg\ta.png\tb.png\n\t\tx.png\n");
    err.clear();
    EXPECT_FALSE(batch_composer::parse_manifest(empty_field, requests, err));
    EXPECT_FALSE(err.empty());

    std::istringstream bad_flag("bg.jpg\tasset.png\tone.png\ton\nbg.jpg\tasset.png\ttwo.png\tmaybe\n");
    err.clear();
    EXPECT_FALSE(batch_composer::parse_manifest(bad_flag, requests, err));
    EXPECT_NE(err.find("manifest line 2"), std::string::npos) << err;
    EXPECT_NE(err.find("maybe"), std::string::npos) << err;

    err.clear();
    EXPECT_FALSE(batch_composer::load_manifest("/nonexistent/manifest.tsv", requests, err));
    EXPECT_NE(err.find("cannot open manifest"), std::string::npos);
}

TEST(batch_composer, never_exceeds_concurrency_and_joins_each_wave) {
    scratch_dir dir("batch-waves");
    test_support::write_png(dir.file("bg.png"), raster_image(90, 160, {20, 20, 60, 255}));
    test_support::write_png(dir.file("asset.png"), raster_image(120, 120, {240, 200, 10, 255}));

    std::vector<composition_request> requests;
    for (int i = 0; i < 7; ++i) {
        composition_request r;
        r.background_path = dir.file("bg.png");
        r.asset_path = dir.file("asset.png");
        r.output_path = dir.file("wave" + std::to_string(i) + ".png");
        requests.push_back(r);
    }

    auto detector = std::make_unique<wave_tracking_detector>(3);
    const wave_tracking_detector* tracker = detector.get();
    const story_composer c(quiet_config(), std::move(detector));
    const batch_composer batch(c, 3);
    const auto outcomes = batch.run(requests);

    for (const auto& o : outcomes) EXPECT_TRUE(o.succeeded()) << o.error;
    EXPECT_LE(tracker->peak(), 3);
    EXPECT_EQ(tracker->peak(), 3);
    // waves of 3, 3 and 1: a wave starts only after every detection of the previous one ended
    EXPECT_EQ(tracker->finished_at_start(), (std::vector<int>{0, 0, 0, 3, 3, 3, 6}));
}
