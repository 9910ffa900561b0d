/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/zip_directory.hpp"

#include <algorithm>
#include <array>
#include <span>
#include <utility>

#include <zip.h>

namespace fileguard::archive {

namespace {

ArchiveError from_zip_error(int code) {
    switch (code) {
        case ZIP_ER_NOZIP:
            return ArchiveError::NotAnArchive;
        case ZIP_ER_INCONS:
            return ArchiveError::Inconsistent;
        case ZIP_ER_MULTIDISK:
            return ArchiveError::MultiDisk;
        case ZIP_ER_COMPNOTSUPP:
        case ZIP_ER_ENCRNOTSUPP:
        case ZIP_ER_NOPASSWD:
        case ZIP_ER_WRONGPASSWD:
            return ArchiveError::UnsupportedEntry;
        case ZIP_ER_ZLIB:
        case ZIP_ER_COMPRESSED_DATA:
            return ArchiveError::InflateFailed;
        case ZIP_ER_CRC:
            return ArchiveError::ChecksumMismatch;
        default:
            return ArchiveError::Io;
    }
}

struct ArchiveCloser {
    void operator()(zip_t* za) const noexcept {
        zip_discard(za);
    }
};

struct FileCloser {
    void operator()(zip_file_t* file) const noexcept {
        zip_fclose(file);
    }
};

using FileHandle = std::unique_ptr<zip_file_t, FileCloser>;

}  // namespace

// Exposes a ByteSource to libzip as a seekable, read-only zip_source.
struct ZipDirectory::Archive {
    const io::ByteSource* source;
    zip_uint64_t position = 0;
    zip_error_t error;
    std::unique_ptr<zip_t, ArchiveCloser> handle;

    explicit Archive(const io::ByteSource& src) : source(&src) {
        zip_error_init(&error);
    }

    ~Archive() {
        handle.reset();
        zip_error_fini(&error);
    }

    Archive(const Archive&) = delete;
    Archive& operator=(const Archive&) = delete;

    static zip_int64_t callback(void* userdata, void* data, zip_uint64_t length, zip_source_cmd_t command) {
        return static_cast<Archive*>(userdata)->handle_command(data, length, command);
    }

    zip_int64_t handle_command(void* data, zip_uint64_t length, zip_source_cmd_t command) {
        const zip_uint64_t total = source->size();

        switch (command) {
            case ZIP_SOURCE_OPEN:
                position = 0;
                return 0;

            case ZIP_SOURCE_READ: {
                auto want = static_cast<std::size_t>(std::min(length, total - std::min(position, total)));
                if (want == 0) {
                    return 0;
                }
                auto got = source->read_at(position, std::span<std::byte>(static_cast<std::byte*>(data), want));
                if (!got) {
                    zip_error_set(&error, ZIP_ER_READ, 0);
                    return -1;
                }
                position += *got;
                return static_cast<zip_int64_t>(*got);
            }

            case ZIP_SOURCE_CLOSE:
            case ZIP_SOURCE_FREE:
                return 0;

            case ZIP_SOURCE_STAT: {
                auto* st = ZIP_SOURCE_GET_ARGS(zip_stat_t, data, length, &error);
                if (st == nullptr) {
                    return -1;
                }
                zip_stat_init(st);
                st->valid |= ZIP_STAT_SIZE;
                st->size = total;
                return sizeof(zip_stat_t);
            }

            case ZIP_SOURCE_ERROR:
                return zip_error_to_data(&error, data, length);

            case ZIP_SOURCE_SEEK: {
                zip_int64_t target = zip_source_seek_compute_offset(position, total, data, length, &error);
                if (target < 0) {
                    return -1;
                }
                position = static_cast<zip_uint64_t>(target);
                return 0;
            }

            case ZIP_SOURCE_TELL:
                return static_cast<zip_int64_t>(position);

            case ZIP_SOURCE_SUPPORTS:
                return zip_source_make_command_bitmap(ZIP_SOURCE_OPEN,
                                                      ZIP_SOURCE_READ,
                                                      ZIP_SOURCE_CLOSE,
                                                      ZIP_SOURCE_STAT,
                                                      ZIP_SOURCE_ERROR,
                                                      ZIP_SOURCE_FREE,
                                                      ZIP_SOURCE_SEEK,
                                                      ZIP_SOURCE_TELL,
                                                      ZIP_SOURCE_SUPPORTS,
                                                      -1);

            default:
                zip_error_set(&error, ZIP_ER_OPNOTSUPP, 0);
                return -1;
        }
    }

    ArchiveError last_error() {
        return from_zip_error(zip_error_code_zip(zip_get_error(handle.get())));
    }
};

std::string error_string(ArchiveError err) {
    switch (err) {
        case ArchiveError::NotAnArchive:
            return "Content is not a ZIP archive";
        case ArchiveError::Inconsistent:
            return "ZIP central directory is inconsistent";
        case ArchiveError::MultiDisk:
            return "Multi-disk ZIP archives are not supported";
        case ArchiveError::UnsupportedEntry:
            return "Entry uses an unsupported compression method or encryption";
        case ArchiveError::EntryTooLarge:
            return "Entry exceeds the allowed read size";
        case ArchiveError::InflateFailed:
            return "Failed to decompress entry data";
        case ArchiveError::ChecksumMismatch:
            return "Entry CRC-32 does not match its content";
        case ArchiveError::Io:
            return "Failed to read archive data";
        default:
            return "Unknown archive error";
    }
}

ZipDirectory::ZipDirectory(std::unique_ptr<Archive> archive) noexcept : archive_(std::move(archive)) {}

ZipDirectory::~ZipDirectory() = default;
ZipDirectory::ZipDirectory(ZipDirectory&&) noexcept = default;
ZipDirectory& ZipDirectory::operator=(ZipDirectory&&) noexcept = default;

std::expected<ZipDirectory, ArchiveError> ZipDirectory::open(const io::ByteSource& source) {
    // libzip treats empty input as a new, empty archive.
    if (source.empty()) {
        return std::unexpected(ArchiveError::NotAnArchive);
    }

    auto archive = std::make_unique<Archive>(source);

    zip_error_t error;
    zip_error_init(&error);
    zip_source_t* zsource = zip_source_function_create(&Archive::callback, archive.get(), &error);
    if (zsource == nullptr) {
        zip_error_fini(&error);
        return std::unexpected(ArchiveError::Io);
    }

    zip_t* handle = zip_open_from_source(zsource, ZIP_RDONLY, &error);
    if (handle == nullptr) {
        auto code = zip_error_code_zip(&error);
        zip_source_free(zsource);
        zip_error_fini(&error);
        return std::unexpected(from_zip_error(code));
    }
    zip_error_fini(&error);

    archive->handle.reset(handle);
    return ZipDirectory(std::move(archive));
}

std::uint64_t ZipDirectory::entry_count() const noexcept {
    zip_int64_t count = zip_get_num_entries(archive_->handle.get(), 0);
    return count < 0 ? 0 : static_cast<std::uint64_t>(count);
}

std::expected<std::optional<ZipEntry>, ArchiveError> ZipDirectory::next() {
    if (next_index_ >= entry_count()) {
        return std::optional<ZipEntry>{};
    }

    zip_stat_t st;
    zip_stat_init(&st);
    if (zip_stat_index(archive_->handle.get(), next_index_, ZIP_FL_ENC_RAW, &st) != 0) {
        return std::unexpected(archive_->last_error());
    }

    ZipEntry entry;
    entry.index = next_index_;
    if (st.valid & ZIP_STAT_NAME)
        entry.name = st.name;
    if (st.valid & ZIP_STAT_SIZE)
        entry.uncompressed_size = st.size;
    if (st.valid & ZIP_STAT_COMP_SIZE)
        entry.compressed_size = st.comp_size;
    if (st.valid & ZIP_STAT_COMP_METHOD)
        entry.method = st.comp_method;
    if (st.valid & ZIP_STAT_CRC)
        entry.crc32 = st.crc;
    entry.encrypted = (st.valid & ZIP_STAT_ENCRYPTION_METHOD) && st.encryption_method != ZIP_EM_NONE;

    ++next_index_;
    return std::optional<ZipEntry>(std::move(entry));
}

std::expected<std::vector<ZipEntry>, ArchiveError> ZipDirectory::read_all() {
    rewind();

    std::vector<ZipEntry> entries;
    entries.reserve(static_cast<std::size_t>(entry_count()));
    while (true) {
        auto entry = next();
        if (!entry) {
            return std::unexpected(entry.error());
        }
        if (!entry->has_value())
            break;
        entries.push_back(std::move(**entry));
    }
    return entries;
}

std::expected<std::optional<ZipEntry>, ArchiveError> ZipDirectory::find(std::string_view name) {
    const std::string key(name);
    zip_int64_t index = zip_name_locate(archive_->handle.get(), key.c_str(), ZIP_FL_ENC_RAW);
    if (index < 0) {
        return std::optional<ZipEntry>{};
    }

    auto saved = std::exchange(next_index_, static_cast<std::uint64_t>(index));
    auto entry = next();
    next_index_ = saved;
    return entry;
}

std::expected<std::string, ArchiveError> ZipDirectory::read_entry(const ZipEntry& entry,
                                                                  std::size_t max_bytes) {
    if (entry.encrypted || !zip_compression_method_supported(entry.method, 0)) {
        return std::unexpected(ArchiveError::UnsupportedEntry);
    }

    if (entry.uncompressed_size > max_bytes) {
        return std::unexpected(ArchiveError::EntryTooLarge);
    }

    FileHandle file(zip_fopen_index(archive_->handle.get(), entry.index, 0));
    if (!file) {
        return std::unexpected(archive_->last_error());
    }

    // libzip verifies the CRC-32 once the last byte has been read.
    std::string output;
    std::array<char, 16 * 1024> chunk;
    while (true) {
        zip_int64_t n = zip_fread(file.get(), chunk.data(), chunk.size());
        if (n < 0) {
            return std::unexpected(from_zip_error(zip_error_code_zip(zip_file_get_error(file.get()))));
        }
        if (n == 0)
            break;

        if (output.size() + static_cast<std::size_t>(n) > max_bytes) {
            return std::unexpected(ArchiveError::EntryTooLarge);
        }
        output.append(chunk.data(), static_cast<std::size_t>(n));
    }

    return output;
}

}  // namespace fileguard::archive
