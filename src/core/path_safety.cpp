// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
// Copyright (c) 2025 Alfie Ardinata.

#include "include/path_safety.hpp"

#include <algorithm>
#include <string>

#include "include/utils.hpp"

namespace fileguard::core {

namespace {

bool is_ascii_letter(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

}  // namespace

bool is_suspicious_entry_name(std::string_view name) {
    if (trim_sv(name).empty()) {
        return true;
    }

    if (name.starts_with('/') || name.starts_with('\\')) {
        return true;
    }

    if (name.size() >= 2 && is_ascii_letter(name[0]) && name[1] == ':') {
        return true;
    }

    std::string normalized(name);
    std::ranges::replace(normalized, '\\', '/');

    std::string_view path = normalized;
    return path.contains("../") || path.contains("/..") || path.starts_with("..");
}

}  // namespace fileguard::core
