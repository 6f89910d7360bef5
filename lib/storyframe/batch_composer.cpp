/// \file
/// \brief Batch composition in joined waves of bounded size, plus manifest parsing.
///
/// This source file implements one part of the storyframe composition engine. Each wave holds
/// at most N raster pipelines in memory; the next wave starts only after all threads joined.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#include "storyframe/batch_composer.h"
#include "storyframe/parse_util.h"

#include <algorithm>
#include <exception>
#include <fstream>
#include <iostream>
#include <istream>
#include <set>
#include <string_view>
#include <system_error>
#include <thread>

namespace {

/// \brief split_tabs.
std::vector<std::string_view> split_tabs(std::string_view line) {
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    while (true) {
        const std::size_t tab = line.find('\t', start);
        if (tab == std::string_view::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, tab - start));
        start = tab + 1;
    }
    return fields;
}

/// \brief run_one.
void run_one(const story_composer& composer, batch_item_outcome& outcome) {
    try {
        outcome.result = composer.compose(outcome.request);
        if (!outcome.result->success) outcome.error = outcome.result->analytics.error;
    } catch (const composition_error& e) {
        outcome.error = e.what();
    } catch (const std::exception& e) {
        outcome.error = std::string("unexpected failure: ") + e.what();
    }
}

} // namespace

batch_composer::batch_composer(const story_composer& composer, std::size_t concurrency)
    : composer_(composer), concurrency_(std::max<std::size_t>(1, concurrency)) {}

/// \brief batch_composer::waves_for.
std::size_t batch_composer::waves_for(std::size_t count) const {
    return (count + concurrency_ - 1) / concurrency_;
}

/// \brief batch_composer::run.
std::vector<batch_item_outcome> batch_composer::run(const std::vector<composition_request>& requests) const {
    std::vector<batch_item_outcome> outcomes(requests.size());
    std::vector<std::size_t> runnable;

    // concurrent calls derive their temp files from the output path
    std::set<std::string> outputs;
    for (std::size_t i = 0; i < requests.size(); ++i) {
        outcomes[i].request = requests[i];
        std::error_code ec;
        std::filesystem::path key_path = std::filesystem::absolute(requests[i].output_path, ec);
        if (ec) key_path = requests[i].output_path;
        const std::string key = key_path.lexically_normal().string();
        if (!outputs.insert(key).second) {
            outcomes[i].error = "duplicate output path in batch: " + requests[i].output_path.string();
            std::cerr << "warning: " << outcomes[i].error << "\n";
            continue;
        }
        runnable.push_back(i);
    }

    const std::size_t waves = waves_for(runnable.size());
    for (std::size_t wave = 0; wave < waves; ++wave) {
        const std::size_t begin = wave * concurrency_;
        const std::size_t end = std::min(runnable.size(), begin + concurrency_);
        if (!composer_.config().quiet) {
            std::cout << "[batch] wave " << (wave + 1) << "/" << waves << ": " << (end - begin) << " item(s)\n";
        }

        std::vector<std::thread> workers;
        workers.reserve(end - begin);
        for (std::size_t k = begin; k < end; ++k) {
            batch_item_outcome& outcome = outcomes[runnable[k]];
            workers.emplace_back([this, &outcome]() { run_one(composer_, outcome); });
        }
        for (auto& t : workers) t.join();
    }

    std::size_t ok = 0;
    for (const auto& o : outcomes) {
        if (o.succeeded()) ++ok;
    }
    if (!composer_.config().quiet) std::cout << "[batch] " << ok << "/" << outcomes.size() << " succeeded\n";
    return outcomes;
}

/// \brief batch_composer::parse_manifest.
bool batch_composer::parse_manifest(std::istream& in, std::vector<composition_request>& out, std::string& err) {
    out.clear();
    std::string raw;
    int line_no = 0;
    while (std::getline(in, raw)) {
        ++line_no;
        const std::string_view line = trim_view(raw);
        if (line.empty() || line.front() == '#') continue;

        const auto fields = split_tabs(line);
        if (fields.size() < 3 || fields.size() > 5) {
            err = "manifest line " + std::to_string(line_no) + ": expected 3 to 5 tab-separated fields, got " + std::to_string(fields.size());
            return false;
        }

        composition_request r;
        r.background_path = std::string(trim_view(fields[0]));
        r.asset_path = std::string(trim_view(fields[1]));
        r.output_path = std::string(trim_view(fields[2]));
        if (r.background_path.empty() || r.asset_path.empty() || r.output_path.empty()) {
            err = "manifest line " + std::to_string(line_no) + ": empty path";
            return false;
        }
        if (fields.size() >= 4 && !trim_view(fields[3]).empty()) {
            const std::optional<bool> caption = parse_bool(fields[3]);
            if (!caption) {
                err = "manifest line " + std::to_string(line_no) + ": caption flag must be on or off, got '" + std::string(trim_view(fields[3])) + "'";
                return false;
            }
            r.include_caption = *caption;
        }
        if (fields.size() == 5) r.caption_override = std::string(fields[4]);
        out.push_back(std::move(r));
    }
    return true;
}

/// \brief batch_composer::load_manifest.
bool batch_composer::load_manifest(const std::filesystem::path& path, std::vector<composition_request>& out, std::string& err) {
    std::ifstream f(path);
    if (!f) {
        err = "cannot open manifest: " + path.string();
        return false;
    }
    return parse_manifest(f, out, err);
}
