/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#pragma once
#include <filesystem>
#include <optional>
#include <string>

enum class run_mode {
    single,
    preview,
    batch
};

struct storyframe_options {
    run_mode mode{run_mode::single};

    std::filesystem::path background;
    std::filesystem::path asset;
    std::filesystem::path output;

    bool include_caption{true};
    std::optional<std::string> caption;        // overrides the default caption
    std::optional<std::string> default_caption;

    std::filesystem::path font;                // empty = built-in default
    int font_size{0};                          // 0 = built-in default

    std::filesystem::path markup_file;         // write caption SVG here
    std::filesystem::path batch_file;
    int concurrency{5};

    bool quiet{false};
};
