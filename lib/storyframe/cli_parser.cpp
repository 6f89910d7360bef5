/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#include "storyframe/cli_parser.h"
#include <iostream>

extern "C" {
#include <argparse.h>
}

// ---- parse ---------------------------------------------------------------

int cli_parser::parse(int argc, const char** argv, storyframe_options& out) const {
    // argparse target variables
    const char* background_str = nullptr;
    const char* asset_str = nullptr;
    const char* output_str = nullptr;
    const char* caption_str = nullptr;
    const char* default_caption_str = nullptr;
    const char* font_str = nullptr;
    const char* markup_str = nullptr;
    const char* batch_str = nullptr;

    int no_caption_flag = 0;
    int preview_flag = 0;
    int quiet_flag = 0;
    int font_size = 0;
    int concurrency = 5;

    const char* const usage[] = {
        "storyframe -b <background> -a <asset> -o <output> [options]",
        "storyframe --batch <manifest> [options]",
        nullptr
    };

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"

    struct argparse_option options[] = {
        // inputs & output
        OPT_STRING('b', "background", &background_str, "background image (.png, .jpg, .jpeg)"),
        OPT_STRING('a', "asset",      &asset_str,      "foreground asset image (.png, .jpg, .jpeg)"),
        OPT_STRING('o', "output",     &output_str,     "output filename (always PNG encoded)"),

        // caption
        OPT_BOOLEAN( 0, "no-caption",      &no_caption_flag,     "compose without caption"),
        OPT_STRING('t', "caption",         &caption_str,         "caption text for this story"),
        OPT_STRING(  0, "default-caption", &default_caption_str, "caption used when none is given and on retry"),
        OPT_STRING(  0, "font",            &font_str,            "caption font file (ttf/otf)"),
        OPT_INTEGER( 0, "font-size",       &font_size,           "caption font size in pixels"),
        OPT_STRING(  0, "markup",          &markup_str,          "write caption SVG markup to file"),

        // modes
        OPT_BOOLEAN( 0, "preview",     &preview_flag, "uncaptioned preview, retried once on failure"),
        OPT_STRING(  0, "batch",       &batch_str,    "manifest: background<TAB>asset<TAB>output per line"),
        OPT_INTEGER( 0, "concurrency", &concurrency,  "batch compositions per wave (default 5)"),

        OPT_BOOLEAN('q', "quiet", &quiet_flag, "suppress progress output"),

        OPT_HELP(),
        OPT_END()
    };

#pragma GCC diagnostic pop

    struct argparse ap{};
    argparse_init(&ap, options, usage, 0);
    argparse_describe(&ap, "storyframe story image composer",
                           "example: storyframe -b bg.jpg -a product.png -o story.png -t \"New drop\"");
    int nargs = argparse_parse(&ap, argc, argv);

    if (nargs > 0) {
        std::cerr << "error: unexpected argument '" << argv[0] << "'\n";
        return 2;
    }

    // fill output struct
    out.include_caption = (no_caption_flag == 0);
    out.quiet = (quiet_flag != 0);
    if (background_str) out.background = background_str;
    if (asset_str) out.asset = asset_str;
    if (output_str) out.output = output_str;
    if (caption_str) out.caption = std::string(caption_str);
    if (default_caption_str) out.default_caption = std::string(default_caption_str);
    if (font_str) out.font = font_str;
    if (markup_str) out.markup_file = markup_str;
    out.font_size = font_size;
    out.concurrency = concurrency;

    if (batch_str) {
        out.mode = run_mode::batch;
        out.batch_file = batch_str;
    } else if (preview_flag) {
        out.mode = run_mode::preview;
    } else {
        out.mode = run_mode::single;
    }

    if (out.mode == run_mode::batch) {
        if (!out.background.empty() || !out.asset.empty() || !out.output.empty()) {
            std::cerr << "error: --batch cannot be combined with --background/--asset/--output\n";
            return 2;
        }
        if (preview_flag) {
            std::cerr << "error: --batch cannot be combined with --preview\n";
            return 2;
        }
    } else {
        if (out.background.empty()) {
            std::cerr << "error: --background is required\n";
            return 1;
        }
        if (out.asset.empty()) {
            std::cerr << "error: --asset is required\n";
            return 1;
        }
        if (out.output.empty()) {
            std::cerr << "error: --output is required\n";
            return 1;
        }
    }

    if (font_size < 0 || font_size > 500) {
        std::cerr << "error: invalid --font-size; expected 1..500\n";
        return 2;
    }
    if (concurrency < 1) {
        std::cerr << "error: invalid --concurrency; expected a positive integer\n";
        return 2;
    }

    if (!out.include_caption && out.caption) {
        std::cerr << "warning: --caption ignored with --no-caption\n";
    }
    if (!out.markup_file.empty() && (out.mode != run_mode::single || !out.include_caption)) {
        std::cerr << "warning: --markup only applies to a single captioned composition\n";
    }
    return 0;
}
