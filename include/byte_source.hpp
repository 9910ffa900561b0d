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
#include <filesystem>
#include <iosfwd>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "file_descriptor.hpp"

namespace fileguard::io {

enum class IoError {
    OpenFailed,
    NotSeekable,
    ReadFailed,
    TooLarge,
    OutOfRange
};

std::string error_string(IoError err);

// Random-access view over untrusted content. Implementations never allocate
// proportionally to anything other than the bytes the caller asks for.
class ByteSource {
   public:
    virtual ~ByteSource() = default;

    [[nodiscard]] virtual std::uint64_t size() const noexcept = 0;

    // Reads up to buffer.size() bytes at `offset`. A short count means EOF.
    [[nodiscard]] virtual std::expected<std::size_t, IoError> read_at(
        std::uint64_t offset, std::span<std::byte> buffer) const = 0;

    [[nodiscard]] bool empty() const noexcept {
        return size() == 0;
    }

    // Reads exactly buffer.size() bytes or fails with OutOfRange.
    [[nodiscard]] std::expected<void, IoError> read_exact(std::uint64_t offset,
                                                          std::span<std::byte> buffer) const;
};

class MemoryByteSource final : public ByteSource {
    std::vector<std::byte> owned_;
    std::span<const std::byte> view_;

   public:
    explicit MemoryByteSource(std::vector<std::byte> data);
    explicit MemoryByteSource(std::span<const std::byte> borrowed) noexcept;

    MemoryByteSource(const MemoryByteSource&) = delete;
    MemoryByteSource& operator=(const MemoryByteSource&) = delete;
    MemoryByteSource(MemoryByteSource&& other) noexcept;
    MemoryByteSource& operator=(MemoryByteSource&& other) noexcept;

    static MemoryByteSource from_string(std::string_view text);

    [[nodiscard]] std::uint64_t size() const noexcept override {
        return view_.size();
    }

    [[nodiscard]] std::expected<std::size_t, IoError> read_at(
        std::uint64_t offset, std::span<std::byte> buffer) const override;
};

class FileByteSource final : public ByteSource {
    FileDescriptor fd_;
    std::uint64_t size_ = 0;
    std::filesystem::path path_;

    FileByteSource(FileDescriptor fd, std::uint64_t size, std::filesystem::path path)
        : fd_(std::move(fd)), size_(size), path_(std::move(path)) {}

   public:
    static std::expected<FileByteSource, IoError> open(const std::filesystem::path& path);

    [[nodiscard]] const std::filesystem::path& path() const noexcept {
        return path_;
    }

    [[nodiscard]] std::uint64_t size() const noexcept override {
        return size_;
    }

    [[nodiscard]] std::expected<std::size_t, IoError> read_at(
        std::uint64_t offset, std::span<std::byte> buffer) const override;
};

// Drains a forward-only stream into memory so it can be inspected randomly.
std::expected<MemoryByteSource, IoError> read_all_seekable(std::istream& in,
                                                           std::uint64_t max_bytes);

}  // namespace fileguard::io
