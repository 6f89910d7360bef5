/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#pragma once
#include "options.h"

class cli_parser {
public:
    // returns 0 on success, 1 on missing input, 2 on an invalid value. On success, fills out.
    // Note: -h/--help is handled by argparse and will print usage & exit(0).
    int parse(int argc, const char** argv, storyframe_options& out) const;
};
