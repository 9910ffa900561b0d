// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
// Copyright (c) 2025 Alfie Ardinata.

#include "include/format_classifier.hpp"

#include <algorithm>
#include <array>

#include "include/utils.hpp"

namespace fileguard::core {

namespace {

constexpr std::array OPEN_XML_FORMATS = {ext::DOCX, ext::XLSX, ext::PPTX};
constexpr std::array OPEN_DOCUMENT_FORMATS = {ext::ODT, ext::ODS, ext::ODP};

template <std::size_t N>
bool contains_ci(const std::array<std::string_view, N>& set, std::string_view extension) noexcept {
    return std::ranges::any_of(set, [&](std::string_view e) { return iequals(e, extension); });
}

}  // namespace

std::string extension_of(std::string_view file_name) {
    auto slash = file_name.find_last_of("/\\");
    if (slash != std::string_view::npos) {
        file_name.remove_prefix(slash + 1);
    }

    auto dot = file_name.rfind('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 == file_name.size()) {
        return {};
    }
    return to_lower(file_name.substr(dot));
}

bool is_open_xml_format(std::string_view extension) noexcept {
    return contains_ci(OPEN_XML_FORMATS, extension);
}

bool is_open_document_format(std::string_view extension) noexcept {
    return contains_ci(OPEN_DOCUMENT_FORMATS, extension);
}

bool requires_preflight(std::string_view extension) noexcept {
    return is_open_xml_format(extension) || is_open_document_format(extension);
}

}  // namespace fileguard::core
