/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#include <fstream>
#include <iostream>
#include <vector>
#include "storyframe/batch_composer.h"
#include "storyframe/cli_parser.h"
#include "storyframe/composer.h"
#include "storyframe/options.h"

static composer_config make_config(const storyframe_options& opt) {
    composer_config cfg;
    cfg.quiet = opt.quiet;
    if (!opt.font.empty()) cfg.style.font_path = opt.font;
    if (opt.font_size > 0) cfg.style.font_size = opt.font_size;
    if (opt.default_caption) cfg.default_caption = *opt.default_caption;
    return cfg;
}

static bool write_markup(const std::filesystem::path& path, const std::string& markup) {
    std::ofstream f(path, std::ios::binary);
    if (!f) return false;
    f << markup;
    return static_cast<bool>(f);
}

static int run_batch(const story_composer& composer, const storyframe_options& opt) {
    std::vector<composition_request> requests;
    std::string err;
    if (!batch_composer::load_manifest(opt.batch_file, requests, err)) {
        std::cerr << "error: " << err << "\n";
        return 2;
    }
    if (!opt.include_caption) {
        for (auto& r : requests) r.include_caption = false;
    }

    batch_composer batch(composer, static_cast<std::size_t>(opt.concurrency));
    const auto outcomes = batch.run(requests);

    int failures = 0;
    for (const auto& o : outcomes) {
        if (o.succeeded()) {
            if (!opt.quiet) {
                std::cout << "  ok     " << o.request.output_path.string();
                if (o.result->analytics.fallback_applied) std::cout << " (caption fallback)";
                std::cout << "\n";
            }
        } else {
            ++failures;
            std::cerr << "  failed " << o.request.output_path.string() << ": " << o.error << "\n";
        }
    }
    return failures ? 4 : 0;
}

static int run_preview(const story_composer& composer, const storyframe_options& opt) {
    const preview_result p = composer.generate_preview(opt.background, opt.asset, opt.output);
    if (!p.success) {
        std::cerr << "error: preview failed: " << p.error << "\n";
        return 4;
    }
    if (!opt.quiet) std::cout << "preview: " << p.output_path.string() << " (" << p.generation_time_ms << " ms)\n";
    return 0;
}

static int run_single(const story_composer& composer, const storyframe_options& opt) {
    composition_request req;
    req.background_path = opt.background;
    req.asset_path = opt.asset;
    req.output_path = opt.output;
    req.include_caption = opt.include_caption;
    req.caption_override = opt.caption;

    composition_result res;
    try {
        res = composer.compose(req);
    } catch (const composition_error& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 3;
    }

    if (!res.success) {
        std::cerr << "error: composition failed: " << res.analytics.error << "\n";
        return 4;
    }
    if (!opt.quiet) {
        std::cout << "output: " << res.output_path.string() << "\n";
        std::cout << format_analytics(res.analytics);
    }

    if (!opt.markup_file.empty() && !res.caption_markup.empty()) {
        if (!write_markup(opt.markup_file, res.caption_markup)) {
            std::cerr << "error: cannot write markup to " << opt.markup_file.string() << "\n";
            return 4;
        }
    }
    return 0;
}

int main(int argc, const char** argv) {
    storyframe_options opt;
    cli_parser parser;
    int rc = parser.parse(argc, argv, opt);
    if (rc) return rc;

    const story_composer composer(make_config(opt));
    switch (opt.mode) {
    case run_mode::batch: return run_batch(composer, opt);
    case run_mode::preview: return run_preview(composer, opt);
    case run_mode::single: break;
    }
    return run_single(composer, opt);
}
