/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cmath>
#include <concepts>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include "config.hpp"

namespace fileguard::core {

constexpr std::int64_t kilobytes(std::integral auto value) noexcept {
    return static_cast<std::int64_t>(value) * static_cast<std::int64_t>(Config::KIB);
}

constexpr std::int64_t megabytes(std::integral auto value) noexcept {
    return static_cast<std::int64_t>(value) * static_cast<std::int64_t>(Config::MIB);
}

constexpr std::int64_t gigabytes(std::integral auto value) noexcept {
    return static_cast<std::int64_t>(value) * static_cast<std::int64_t>(Config::GIB);
}

// Fractional sizes round up to the next whole byte.
inline std::int64_t kilobytes(double value) {
    return static_cast<std::int64_t>(std::ceil(value * static_cast<double>(Config::KIB)));
}

inline std::int64_t megabytes(double value) {
    return static_cast<std::int64_t>(std::ceil(value * static_cast<double>(Config::MIB)));
}

inline std::int64_t gigabytes(double value) {
    return static_cast<std::int64_t>(std::ceil(value * static_cast<double>(Config::GIB)));
}

// Parses "25 MB", "2.5gb", " 512 B " (binary multiples, units B/KB/MB/GB).
std::expected<std::int64_t, std::string> parse_byte_size(std::string_view text);

}  // namespace fileguard::core
