/// \file
/// \brief Caption tier mapping.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#include "storyframe/caption_tiers.h"

caption_tier caption_tiers::from_edge(int asset_bottom_y) {
    if (asset_bottom_y == 0 || asset_bottom_y < middle_band_top) return {1, tier1_y};
    if (asset_bottom_y <= middle_band_bottom) return {2, tier2_y};
    return {3, tier3_y};
}
