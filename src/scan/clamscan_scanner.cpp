/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/malware_scanner.hpp"

#include <cerrno>
#include <cstdint>
#include <format>
#include <random>
#include <span>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "include/file_descriptor.hpp"
#include "include/shell_pipe.hpp"
#include "include/utils.hpp"

namespace fileguard::scan {

namespace {

constexpr int CLAMSCAN_CLEAN = 0;
constexpr int CLAMSCAN_INFECTED = 1;
constexpr int TEMP_NAME_ATTEMPTS = 8;

// Owner-only scratch file that never follows a planted symlink and is removed
// on every exit path.
class ScanTempFile {
    FileDescriptor fd_;
    std::filesystem::path path_;

    ScanTempFile(FileDescriptor fd, std::filesystem::path path)
        : fd_(std::move(fd)), path_(std::move(path)) {}

   public:
    ScanTempFile(ScanTempFile&& other) noexcept
        : fd_(std::move(other.fd_)), path_(std::exchange(other.path_, {})) {}
    ScanTempFile& operator=(ScanTempFile&&) = delete;
    ScanTempFile(const ScanTempFile&) = delete;
    ScanTempFile& operator=(const ScanTempFile&) = delete;

    ~ScanTempFile() {
        fd_.reset();
        if (!path_.empty()) {
            std::error_code ec;
            std::filesystem::remove(path_, ec);
        }
    }

    static std::expected<ScanTempFile, std::string> create(const std::filesystem::path& dir) {
        std::random_device rd;
        std::uniform_int_distribution<std::uint64_t> dist;

        for (int attempt = 0; attempt < TEMP_NAME_ATTEMPTS; ++attempt) {
            auto path = dir / std::format("{}{:016x}", Config::SCAN_TEMP_PREFIX, dist(rd));
            int fd = ::open(
                path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, S_IRUSR | S_IWUSR);
            if (fd >= 0) {
                return ScanTempFile(FileDescriptor(fd), std::move(path));
            }
            if (errno != EEXIST && errno != ELOOP) {
                return std::unexpected(std::format("Failed to create scan file in '{}': {}",
                                                   dir.string(),
                                                   std::system_category().message(errno)));
            }
        }
        return std::unexpected(
            std::format("Unable to create scan file in '{}': names exhausted", dir.string()));
    }

    std::expected<void, std::string> write_from(const io::ByteSource& content) {
        std::vector<std::byte> chunk(Config::STREAM_READ_CHUNK);
        std::uint64_t offset = 0;
        while (offset < content.size()) {
            auto n = content.read_at(offset, chunk);
            if (!n) {
                return std::unexpected(io::error_string(n.error()));
            }
            if (*n == 0) {
                break;
            }
            if (auto w = fd_.write_all(std::span<const std::byte>(chunk.data(), *n)); !w) {
                return std::unexpected(w.error());
            }
            offset += *n;
        }
        fd_.reset();
        return {};
    }

    [[nodiscard]] const std::filesystem::path& path() const noexcept {
        return path_;
    }
};

}  // namespace

ClamScanScanner::ClamScanScanner(std::string binary, std::filesystem::path temp_dir)
    : binary_(std::move(binary)), temp_dir_(std::move(temp_dir)) {
    if (binary_.empty()) {
        throw std::invalid_argument("ClamScanScanner: empty binary name");
    }
}

std::expected<ScanVerdict, std::string> ClamScanScanner::scan(const io::ByteSource& content,
                                                              std::string_view /*file_name*/) const {
    std::error_code ec;
    auto dir = temp_dir_.empty() ? std::filesystem::temp_directory_path(ec) : temp_dir_;
    if (ec) {
        return std::unexpected(std::format("No temporary directory: {}", ec.message()));
    }

    auto temp = ScanTempFile::create(dir);
    if (!temp) {
        return std::unexpected(temp.error());
    }
    if (auto w = temp->write_from(content); !w) {
        return std::unexpected(std::format("Failed to stage content for scanning: {}", w.error()));
    }

    std::string output;
    int status = -1;
    try {
        ShellPipe pipe({binary_, "--no-summary", "--infected", temp->path().string()});
        output = pipe.read_all();
        status = pipe.wait();
    } catch (const std::system_error& e) {
        return std::unexpected(std::format("Failed to run {}: {}", binary_, e.what()));
    }

    switch (status) {
        case CLAMSCAN_CLEAN:
            return ScanVerdict::Clean;
        case CLAMSCAN_INFECTED:
            return ScanVerdict::Infected;
        default:
            return std::unexpected(
                std::format("{} exited with status {}: {}", binary_, status, trim_sv(output)));
    }
}

}  // namespace fileguard::scan
