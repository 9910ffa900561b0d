/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <string>
#include <string_view>

namespace fileguard::core {

namespace ext {
constexpr std::string_view JPEG = ".jpeg";
constexpr std::string_view JPG = ".jpg";
constexpr std::string_view JPE = ".jpe";
constexpr std::string_view PDF = ".pdf";
constexpr std::string_view PNG = ".png";
constexpr std::string_view BMP = ".bmp";
constexpr std::string_view DOC = ".doc";
constexpr std::string_view DOCX = ".docx";
constexpr std::string_view ODT = ".odt";
constexpr std::string_view ODS = ".ods";
constexpr std::string_view ODP = ".odp";
constexpr std::string_view RTF = ".rtf";
constexpr std::string_view XLS = ".xls";
constexpr std::string_view XLSX = ".xlsx";
constexpr std::string_view PPTX = ".pptx";
constexpr std::string_view M4A = ".m4a";
constexpr std::string_view MOV = ".mov";
constexpr std::string_view AVI = ".avi";
constexpr std::string_view MP3 = ".mp3";
constexpr std::string_view MP4 = ".mp4";
constexpr std::string_view WAV = ".wav";
}  // namespace ext

// Lower-cased extension of the last path component, including the dot.
// Empty when the name has none (or only a leading dot, as in ".profile").
[[nodiscard]] std::string extension_of(std::string_view file_name);

[[nodiscard]] bool is_open_xml_format(std::string_view extension) noexcept;
[[nodiscard]] bool is_open_document_format(std::string_view extension) noexcept;

// Archive-backed document formats that must pass ZIP preflight.
[[nodiscard]] bool requires_preflight(std::string_view extension) noexcept;

}  // namespace fileguard::core
