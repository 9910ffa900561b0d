/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace Config {
    constexpr std::string_view APP_NAME = "fileguard";
    constexpr std::string_view APP_VERSION = "1.2.0";
    constexpr int APP_INFO_LABEL_WIDTH = 12;

    constexpr std::uint64_t KIB = 1024;
    constexpr std::uint64_t MIB = KIB * 1024;
    constexpr std::uint64_t GIB = MIB * 1024;

    constexpr std::int64_t DEFAULT_FILE_SIZE_LIMIT = 25 * MIB;

    constexpr std::int64_t PREFLIGHT_MAX_ENTRIES = 10'000;
    constexpr std::int64_t PREFLIGHT_TOTAL_UNCOMPRESSED_LIMIT = 512 * MIB;
    constexpr std::int64_t PREFLIGHT_ENTRY_UNCOMPRESSED_LIMIT = 128 * MIB;
    constexpr double PREFLIGHT_COMPRESSION_RATE_LIMIT = 200.0;

    // Value accepted in configuration files for "no limit".
    constexpr std::int64_t UNLIMITED_SENTINEL = -1;

    constexpr std::size_t PDF_SIGNATURE_SCAN_LENGTH = 1024;

    constexpr std::size_t ODF_MIMETYPE_MAX_BYTES = 100;
    constexpr std::size_t STRUCTURE_PART_MAX_BYTES = 4 * MIB;

    constexpr std::size_t STREAM_READ_CHUNK = 64 * KIB;
    constexpr std::size_t SCANNER_OUTPUT_LIMIT = 1 * MIB;
    constexpr std::string_view CLAMSCAN_BINARY = "clamscan";
    constexpr std::string_view SCAN_TEMP_PREFIX = "fileguard-scan-";
}
