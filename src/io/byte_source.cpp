/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/byte_source.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <istream>
#include <utility>

#include <sys/stat.h>

#include "include/config.hpp"

namespace fileguard::io {

std::string error_string(IoError err) {
    switch (err) {
        case IoError::OpenFailed:
            return "Failed to open input";
        case IoError::NotSeekable:
            return "Input is not a seekable regular file";
        case IoError::ReadFailed:
            return "Failed to read input";
        case IoError::TooLarge:
            return "Input exceeds the maximum readable size";
        case IoError::OutOfRange:
            return "Read past the end of input";
        default:
            return "Unknown I/O error";
    }
}

std::expected<void, IoError> ByteSource::read_exact(std::uint64_t offset,
                                                    std::span<std::byte> buffer) const {
    if (offset > size() || buffer.size() > size() - offset) {
        return std::unexpected(IoError::OutOfRange);
    }

    auto n = read_at(offset, buffer);
    if (!n) {
        return std::unexpected(n.error());
    }
    if (*n != buffer.size()) {
        return std::unexpected(IoError::OutOfRange);
    }
    return {};
}

MemoryByteSource::MemoryByteSource(std::vector<std::byte> data)
    : owned_(std::move(data)), view_(owned_) {}

MemoryByteSource::MemoryByteSource(std::span<const std::byte> borrowed) noexcept
    : view_(borrowed) {}

// The view must be re-pointed after a move when it referenced our own buffer.
MemoryByteSource::MemoryByteSource(MemoryByteSource&& other) noexcept {
    bool owns = other.view_.data() == other.owned_.data();
    owned_ = std::move(other.owned_);
    view_ = owns ? std::span<const std::byte>(owned_) : other.view_;
    other.view_ = {};
}

MemoryByteSource& MemoryByteSource::operator=(MemoryByteSource&& other) noexcept {
    if (this != &other) {
        bool owns = other.view_.data() == other.owned_.data();
        owned_ = std::move(other.owned_);
        view_ = owns ? std::span<const std::byte>(owned_) : other.view_;
        other.view_ = {};
    }
    return *this;
}

MemoryByteSource MemoryByteSource::from_string(std::string_view text) {
    std::vector<std::byte> data(text.size());
    if (!text.empty()) {
        std::memcpy(data.data(), text.data(), text.size());
    }
    return MemoryByteSource(std::move(data));
}

std::expected<std::size_t, IoError> MemoryByteSource::read_at(std::uint64_t offset,
                                                              std::span<std::byte> buffer) const {
    if (offset >= view_.size()) {
        return std::size_t{0};
    }

    std::size_t available = view_.size() - static_cast<std::size_t>(offset);
    std::size_t n = std::min(available, buffer.size());
    std::memcpy(buffer.data(), view_.data() + offset, n);
    return n;
}

std::expected<FileByteSource, IoError> FileByteSource::open(const std::filesystem::path& path) {
    auto fd = FileDescriptor::open_read_only(path);
    if (!fd) {
        return std::unexpected(IoError::OpenFailed);
    }

    auto st = fd->status();
    if (!st) {
        return std::unexpected(IoError::ReadFailed);
    }

    if (!S_ISREG(st->st_mode)) {
        return std::unexpected(IoError::NotSeekable);
    }

    return FileByteSource(std::move(*fd), static_cast<std::uint64_t>(st->st_size), path);
}

std::expected<std::size_t, IoError> FileByteSource::read_at(std::uint64_t offset,
                                                            std::span<std::byte> buffer) const {
    if (offset >= size_) {
        return std::size_t{0};
    }

    auto max_len = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), size_ - offset));
    auto n = fd_.read_at(offset, buffer.first(max_len));
    if (!n) {
        return std::unexpected(IoError::ReadFailed);
    }
    return *n;
}

std::expected<MemoryByteSource, IoError> read_all_seekable(std::istream& in,
                                                           std::uint64_t max_bytes) {
    std::vector<std::byte> data;
    std::array<char, Config::STREAM_READ_CHUNK> buffer;

    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto got = static_cast<std::size_t>(in.gcount());
        if (got == 0)
            break;

        if (data.size() + got > max_bytes) {
            return std::unexpected(IoError::TooLarge);
        }

        auto* first = reinterpret_cast<const std::byte*>(buffer.data());
        data.insert(data.end(), first, first + got);
    }

    if (in.bad()) {
        return std::unexpected(IoError::ReadFailed);
    }

    return MemoryByteSource(std::move(data));
}

}  // namespace fileguard::io
