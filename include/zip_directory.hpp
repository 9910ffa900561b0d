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
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "byte_source.hpp"

namespace fileguard::archive {

enum class ArchiveError {
    NotAnArchive,
    Inconsistent,
    MultiDisk,
    UnsupportedEntry,
    EntryTooLarge,
    InflateFailed,
    ChecksumMismatch,
    Io
};

std::string error_string(ArchiveError err);

struct ZipEntry {
    std::string name;
    std::uint64_t index = 0;
    std::uint64_t uncompressed_size = 0;
    std::uint64_t compressed_size = 0;
    std::uint16_t method = 0;
    std::uint32_t crc32 = 0;
    bool encrypted = false;

    [[nodiscard]] bool is_directory() const noexcept {
        return !name.empty() && name.back() == '/';
    }
};

// Central directory of a ZIP archive read through libzip. Opening fails when
// the directory holds a different number of records than the end of central
// directory record declares. Holds a non-owning reference to the source; it
// must not outlive it.
class ZipDirectory {
    struct Archive;
    std::unique_ptr<Archive> archive_;
    std::uint64_t next_index_ = 0;

    explicit ZipDirectory(std::unique_ptr<Archive> archive) noexcept;

   public:
    ~ZipDirectory();
    ZipDirectory(ZipDirectory&&) noexcept;
    ZipDirectory& operator=(ZipDirectory&&) noexcept;

    static std::expected<ZipDirectory, ArchiveError> open(const io::ByteSource& source);

    [[nodiscard]] std::uint64_t entry_count() const noexcept;

    // Next entry in stored order, or std::nullopt after the last one.
    std::expected<std::optional<ZipEntry>, ArchiveError> next();

    void rewind() noexcept {
        next_index_ = 0;
    }

    std::expected<std::vector<ZipEntry>, ArchiveError> read_all();

    // Exact, case-sensitive name lookup.
    std::expected<std::optional<ZipEntry>, ArchiveError> find(std::string_view name);

    // Content of a single entry, refusing anything that would inflate past max_bytes.
    std::expected<std::string, ArchiveError> read_entry(const ZipEntry& entry, std::size_t max_bytes);
};

}  // namespace fileguard::archive
