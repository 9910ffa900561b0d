/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/byte_size.hpp"

#include <cctype>
#include <format>

#include "include/utils.hpp"

namespace fileguard::core {

std::expected<std::int64_t, std::string> parse_byte_size(std::string_view text) {
    auto value = trim_sv(text);
    if (value.empty()) {
        return std::unexpected("Byte size is empty");
    }

    std::size_t split = 0;
    while (split < value.size() &&
           (std::isdigit(static_cast<unsigned char>(value[split])) || value[split] == '.')) {
        ++split;
    }

    if (split == value.size()) {
        return std::unexpected(std::format("No size unit found in '{}'", value));
    }

    auto number_part = value.substr(0, split);
    if (number_part.empty()) {
        return std::unexpected(std::format("No number found in '{}'", value));
    }

    auto number = parse_number<double>(number_part);
    if (!number) {
        return std::unexpected(std::format("No number found in '{}'", value));
    }

    auto unit = to_lower(trim_sv(value.substr(split)));
    if (unit == "b")
        return static_cast<std::int64_t>(std::ceil(*number));
    if (unit == "kb")
        return kilobytes(*number);
    if (unit == "mb")
        return megabytes(*number);
    if (unit == "gb")
        return gigabytes(*number);

    return std::unexpected(std::format("Unknown or unsupported size unit '{}'", unit));
}

}  // namespace fileguard::core
