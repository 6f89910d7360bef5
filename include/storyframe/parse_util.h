/// \file
/// \brief Shared helpers for parsing flags and colors from text options.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#pragma once

#include <array>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string_view>

inline std::string_view trim_view(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r' || s.front() == '\n')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) s.remove_suffix(1);
    return s;
}

/// Empty when \p raw is not one of 1/true/yes/on or 0/false/no/off.
inline std::optional<bool> parse_bool(std::string_view raw) {
    const std::string_view v = trim_view(raw);
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return std::nullopt;
}

/// "#RRGGBB" or "RRGGBB".
inline std::optional<std::array<std::uint8_t, 3>> parse_hex_rgb(std::string_view s) {
    s = trim_view(s);
    if (s.empty()) return std::nullopt;
    if (s.front() == '#') s.remove_prefix(1);
    if (s.size() != 6) return std::nullopt;

    unsigned value = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value, 16);
    if (ec != std::errc{} || ptr != s.data() + s.size() || value > 0xFFFFFFu) return std::nullopt;

    return std::array<std::uint8_t, 3>{
        static_cast<std::uint8_t>((value >> 16) & 0xFFu),
        static_cast<std::uint8_t>((value >> 8) & 0xFFu),
        static_cast<std::uint8_t>(value & 0xFFu),
    };
}
