/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#include <gtest/gtest.h>
#include <string>
#include <vector>

#include <storyframe/cli_parser.h>
#include <storyframe/options.h>

// helper to build argc/argv arrays
struct argv_builder {
    std::vector<std::string> storage;
    std::vector<const char*> ptrs;

    argv_builder& arg(std::string s) { storage.push_back(std::move(s)); return *this; }
    std::pair<int,const char**> finalize() {
        ptrs.clear();
        for (auto& s : storage) ptrs.push_back(s.c_str());
        ptrs.push_back(nullptr);
        return { static_cast<int>(storage.size()), ptrs.data() };
    }
};

TEST(cli_parser, single_composition_ok) {
    cli_parser p;
    storyframe_options opt;

    argv_builder b;
    b.arg("storyframe")
     .arg("--background").arg("bg.jpg")
     .arg("--asset").arg("product.png")
     .arg("-o").arg("out/story.png")
     .arg("--caption").arg("New drop")
     .arg("--font").arg("fonts/Inter.ttf")
     .arg("--font-size").arg("48")
     .arg("--markup").arg("out/story.svg");

    auto [argc, argv] = b.finalize();
    int rc = p.parse(argc, argv, opt);
    ASSERT_EQ(rc, 0);

    EXPECT_EQ(opt.mode, run_mode::single);
    EXPECT_EQ(opt.background.string(), "bg.jpg");
    EXPECT_EQ(opt.asset.string(), "product.png");
    EXPECT_EQ(opt.output.string(), "out/story.png");
    EXPECT_TRUE(opt.include_caption);
    ASSERT_TRUE(opt.caption.has_value());
    EXPECT_EQ(*opt.caption, "New drop");
    EXPECT_EQ(opt.font.string(), "fonts/Inter.ttf");
    EXPECT_EQ(opt.font_size, 48);
    EXPECT_EQ(opt.markup_file.string(), "out/story.svg");
    EXPECT_FALSE(opt.quiet);
    EXPECT_EQ(opt.concurrency, 5);
}

TEST(cli_parser, short_flags_and_no_caption) {
    cli_parser p;
    storyframe_options opt;

    argv_builder b;
    b.arg("storyframe")
     .arg("-b").arg("bg.png")
     .arg("-a").arg("a.jpeg")
     .arg("-o").arg("o.png")
     .arg("--no-caption")
     .arg("-q")
     .arg("--default-caption").arg("Link in bio");

    auto [argc, argv] = b.finalize();
    int rc = p.parse(argc, argv, opt);
    ASSERT_EQ(rc, 0);

    EXPECT_FALSE(opt.include_caption);
    EXPECT_TRUE(opt.quiet);
    EXPECT_FALSE(opt.caption.has_value());
    ASSERT_TRUE(opt.default_caption.has_value());
    EXPECT_EQ(*opt.default_caption, "Link in bio");
}

TEST(cli_parser, preview_and_batch_modes) {
    {
        cli_parser p;
        storyframe_options opt;
        argv_builder b;
        b.arg("storyframe").arg("--preview").arg("-b").arg("bg.png").arg("-a").arg("a.png").arg("-o").arg("p.png");
        auto [argc, argv] = b.finalize();
        ASSERT_EQ(p.parse(argc, argv, opt), 0);
        EXPECT_EQ(opt.mode, run_mode::preview);
    }
    {
        cli_parser p;
        storyframe_options opt;
        argv_builder b;
        b.arg("storyframe").arg("--batch").arg("jobs.tsv").arg("--concurrency").arg("3");
        auto [argc, argv] = b.finalize();
        ASSERT_EQ(p.parse(argc, argv, opt), 0);
        EXPECT_EQ(opt.mode, run_mode::batch);
        EXPECT_EQ(opt.batch_file.string(), "jobs.tsv");
        EXPECT_EQ(opt.concurrency, 3);
    }
}

TEST(cli_parser, missing_inputs_return_error) {
    cli_parser p;
    storyframe_options opt;

    argv_builder b;
    b.arg("storyframe").arg("-b").arg("bg.png").arg("-o").arg("o.png");

    auto [argc, argv] = b.finalize();
    EXPECT_EQ(p.parse(argc, argv, opt), 1);
}

TEST(cli_parser, invalid_values_return_error) {
    {
        cli_parser p;
        storyframe_options opt;
        argv_builder b;
        b.arg("storyframe").arg("--batch").arg("jobs.tsv").arg("--concurrency").arg("0");
        auto [argc, argv] = b.finalize();
        EXPECT_EQ(p.parse(argc, argv, opt), 2);
    }
    {
        cli_parser p;
        storyframe_options opt;
        argv_builder b;
        b.arg("storyframe").arg("-b").arg("bg.png").arg("-a").arg("a.png").arg("-o").arg("o.png").arg("--font-size").arg("-4");
        auto [argc, argv] = b.finalize();
        EXPECT_EQ(p.parse(argc, argv, opt), 2);
    }
    {
        cli_parser p;
        storyframe_options opt;
        argv_builder b;
        b.arg("storyframe").arg("--batch").arg("jobs.tsv").arg("-o").arg("o.png");
        auto [argc, argv] = b.finalize();
        EXPECT_EQ(p.parse(argc, argv, opt), 2);
    }
    {
        cli_parser p;
        storyframe_options opt;
        argv_builder b;
        b.arg("storyframe").arg("-b").arg("bg.png").arg("-a").arg("a.png").arg("-o").arg("o.png").arg("stray.png");
        auto [argc, argv] = b.finalize();
        EXPECT_EQ(p.parse(argc, argv, opt), 2);
    }
}
