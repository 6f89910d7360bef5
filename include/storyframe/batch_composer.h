/// \file
/// \brief Bounded, wave-by-wave batch composition over one story composer.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#pragma once

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "storyframe/composer.h"

struct batch_item_outcome {
    composition_request request;
    std::optional<composition_result> result; // empty when the item threw
    std::string error;                        // validation or processing message

    [[nodiscard]] bool succeeded() const { return result && result->success; }
};

class batch_composer {
public:
    static constexpr std::size_t k_default_concurrency = 5;

    explicit batch_composer(const story_composer& composer, std::size_t concurrency = k_default_concurrency);

    [[nodiscard]] std::size_t concurrency() const { return concurrency_; }
    [[nodiscard]] std::size_t waves_for(std::size_t count) const;

    /// Outcomes are returned in request order. Requests that share an output path with an
    /// earlier request are not run.
    std::vector<batch_item_outcome> run(const std::vector<composition_request>& requests) const;

    /// One request per line: background<TAB>asset<TAB>output[<TAB>caption on|off[<TAB>caption text]].
    /// Blank lines and lines starting with '#' are skipped.
    static bool parse_manifest(std::istream& in, std::vector<composition_request>& out, std::string& err);
    static bool load_manifest(const std::filesystem::path& path, std::vector<composition_request>& out, std::string& err);

private:
    const story_composer& composer_;
    std::size_t concurrency_;
};
