/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <format>
#include <span>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

class FileDescriptor {
    int fd_ = -1;

   public:
    FileDescriptor() = default;

    explicit FileDescriptor(int fd) : fd_(fd) {
        if (fd_ < 0 && fd != -1) [[unlikely]] {
            throw std::system_error(
                errno, std::generic_category(), "Failed to wrap invalid file descriptor");
        }
    }

    ~FileDescriptor() noexcept {
        reset();
    }

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset(std::exchange(other.fd_, -1));
        }
        return *this;
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    [[nodiscard]] static std::expected<FileDescriptor, std::error_code> open_read_only(
        const std::filesystem::path& path) {
        int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0) {
            return std::unexpected(std::error_code(errno, std::generic_category()));
        }
        return FileDescriptor(fd);
    }

    void reset(int new_fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = new_fd;
    }

    int release() noexcept {
        return std::exchange(fd_, -1);
    }

    [[nodiscard]] std::expected<struct stat, std::error_code> status() const {
        struct stat st {};
        if (::fstat(get(), &st) != 0) {
            return std::unexpected(std::error_code(errno, std::generic_category()));
        }
        return st;
    }

    // Fills as much of `buffer` as the file allows from `offset`; retries on EINTR.
    [[nodiscard]] std::expected<std::size_t, std::error_code> read_at(
        std::uint64_t offset, std::span<std::byte> buffer) const {
        std::size_t total = 0;
        while (total < buffer.size()) {
            ssize_t n = ::pread(get(),
                                buffer.data() + total,
                                buffer.size() - total,
                                static_cast<off_t>(offset + total));
            if (n < 0) {
                if (errno == EINTR)
                    continue;
                return std::unexpected(std::error_code(errno, std::generic_category()));
            }
            if (n == 0)
                break;
            total += static_cast<std::size_t>(n);
        }
        return total;
    }

    [[nodiscard]] std::expected<void, std::string> write_all(std::span<const std::byte> data) const {
        std::size_t written = 0;
        while (written < data.size()) {
            ssize_t n = ::write(get(), data.data() + written, data.size() - written);
            if (n < 0) {
                if (errno == EINTR)
                    continue;
                return std::unexpected(std::format(
                    "write failed: {} (Code: {})", std::system_category().message(errno), errno));
            }
            written += static_cast<std::size_t>(n);
        }
        return {};
    }

    void swap(FileDescriptor& other) noexcept {
        std::swap(fd_, other.fd_);
    }

    [[nodiscard]] int get() const {
        if (fd_ < 0) [[unlikely]] {
            throw std::logic_error("FATAL: Accessing invalid file descriptor (-1)");
        }
        return fd_;
    }

    explicit operator bool() const noexcept {
        return fd_ >= 0;
    }
};

inline void swap(FileDescriptor& a, FileDescriptor& b) noexcept {
    a.swap(b);
}
