/// \file
/// \brief Mapping from detected asset bottom edge to one of three caption positions.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#pragma once

struct caption_tier {
    int tier{1}; // 1 = highest, 3 = lowest
    int y{0};    // baseline of the first caption line
};

namespace caption_tiers {

constexpr int tier1_y = 1560;
constexpr int tier2_y = 1520;
constexpr int tier3_y = 1480;

constexpr int middle_band_top = 900;
constexpr int middle_band_bottom = 1100;

/// \p asset_bottom_y of 0 means "not detected" and maps to tier 1.
caption_tier from_edge(int asset_bottom_y);

/// Fixed position used when a caption attempt is retried with defaults.
constexpr caption_tier fallback() { return {2, tier2_y}; }

} // namespace caption_tiers
