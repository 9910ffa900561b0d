/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <expected>
#include <format>
#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"

[[nodiscard]] constexpr std::string_view trim_sv(std::string_view str) noexcept {
    auto first = str.find_first_not_of(" \t\n\r\v\f");
    if (first == std::string_view::npos)
        return {};
    auto last = str.find_last_not_of(" \t\n\r\v\f");
    return str.substr(first, last - first + 1);
}

[[nodiscard]] inline std::string to_lower(std::string_view text) {
    std::string ret(text);
    std::ranges::transform(ret, ret.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ret;
}

[[nodiscard]] inline bool iequals(std::string_view a, std::string_view b) noexcept {
    return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) {
        return std::tolower(x) == std::tolower(y);
    });
}

// Splits "a,b , c" into trimmed, non-empty parts.
[[nodiscard]] inline std::vector<std::string> split_list(std::string_view text, char sep = ',') {
    std::vector<std::string> parts;
    while (!text.empty()) {
        auto pos = text.find(sep);
        auto part = trim_sv(text.substr(0, pos));
        if (!part.empty())
            parts.emplace_back(part);
        if (pos == std::string_view::npos)
            break;
        text.remove_prefix(pos + 1);
    }
    return parts;
}

inline std::string format_bytes(std::uint64_t bytes) {
    if (bytes == 0)
        return "0 B";

    static constexpr std::array units = {"B", "KB", "MB", "GB", "TB"};

    std::size_t i = 0;
    double d = static_cast<double>(bytes);
    while (d >= 1024 && i < units.size() - 1) {
        d /= 1024;
        i++;
    }
    return std::format("{:.1f} {}", d, units[i]);
}

template <typename T>
std::expected<T, std::errc> parse_number(std::string_view sv) {
    T value;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec == std::errc()) {
        if (ptr == sv.data() + sv.size()) {
            return value;
        }
        return std::unexpected(std::errc::invalid_argument);
    }
    return std::unexpected(ec);
}
