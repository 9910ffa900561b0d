/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cstddef>
#include <expected>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>
#include <unordered_set>

#include "byte_source.hpp"
#include "config.hpp"

namespace fileguard::scan {

enum class ScanVerdict { Clean, Infected };

std::string_view to_string(ScanVerdict verdict) noexcept;

// A detection is a verdict, not an error. The error channel is reserved for
// the scanner itself failing to produce an answer.
class MalwareScanner {
   public:
    virtual ~MalwareScanner() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    [[nodiscard]] virtual std::expected<ScanVerdict, std::string> scan(
        const io::ByteSource& content, std::string_view file_name) const = 0;
};

// Lower-case hex SHA-256 of the whole source.
std::expected<std::string, std::string> sha256_hex(const io::ByteSource& content);

class HashDenyListScanner final : public MalwareScanner {
    std::unordered_set<std::string> digests_;

   public:
    HashDenyListScanner() = default;

    // One digest per line; blank lines and '#' comments are skipped.
    static std::expected<HashDenyListScanner, std::string> parse(std::istream& in);
    static std::expected<HashDenyListScanner, std::string> load(const std::filesystem::path& path);

    // Accepts 64 hex digits in either case.
    std::expected<void, std::string> add_digest(std::string_view hex);

    [[nodiscard]] std::size_t size() const noexcept {
        return digests_.size();
    }

    [[nodiscard]] std::string_view name() const noexcept override {
        return "sha256-deny-list";
    }

    [[nodiscard]] std::expected<ScanVerdict, std::string> scan(
        const io::ByteSource& content, std::string_view file_name) const override;
};

// Hands the content to ClamAV's command line scanner through a private temp file.
class ClamScanScanner final : public MalwareScanner {
    std::string binary_;
    std::filesystem::path temp_dir_;

   public:
    explicit ClamScanScanner(std::string binary = std::string(Config::CLAMSCAN_BINARY),
                             std::filesystem::path temp_dir = {});

    [[nodiscard]] std::string_view name() const noexcept override {
        return "clamscan";
    }

    [[nodiscard]] std::expected<ScanVerdict, std::string> scan(
        const io::ByteSource& content, std::string_view file_name) const override;
};

}  // namespace fileguard::scan
