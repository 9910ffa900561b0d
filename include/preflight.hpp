/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cstdint>
#include <expected>
#include <string>

#include "byte_source.hpp"
#include "preflight_config.hpp"

namespace fileguard::core {

enum class PreflightErrorKind {
    InvalidInput,
    MalformedArchive,
    LimitExceeded
};

enum class PreflightViolation {
    None,
    EntryCount,
    SuspiciousPath,
    CorruptSizeMetadata,
    EntrySize,
    TotalSize,
    CompressionRatio
};

struct PreflightError {
    PreflightErrorKind kind;
    PreflightViolation violation = PreflightViolation::None;
    std::string reason;
    // Offending entry, empty for archive-wide failures.
    std::string entry_name;
};

std::string error_string(PreflightErrorKind kind);
std::string error_string(PreflightViolation violation);

// Declared sizes as the policy sees them. Signed so that forged 64-bit values
// beyond INT64_MAX show up as negative and are rejected as corrupt.
struct ArchiveEntryMetadata {
    std::string name;
    std::int64_t uncompressed_size = 0;
    std::int64_t compressed_size = 0;
};

// Inspects the central directory of a ZIP container against `config`. Only
// directory metadata is read; no entry is decompressed. `config` is expected
// to have passed validate_preflight_config().
std::expected<void, PreflightError> validate_archive(const io::ByteSource& content,
                                                     const PreflightConfig& config);

// Policy applied to a single entry; `running_total` is advanced on success.
std::expected<void, PreflightError> check_entry(const ArchiveEntryMetadata& entry,
                                                const PreflightConfig& config,
                                                std::int64_t& running_total);

// Owns a configuration that has been validated once and is read-only afterwards,
// so one instance can serve concurrent validate() calls.
class ArchivePreflight {
    PreflightConfig config_;

    explicit ArchivePreflight(PreflightConfig config) : config_(std::move(config)) {}

   public:
    static std::expected<ArchivePreflight, ConfigError> create(PreflightConfig config);

    [[nodiscard]] const PreflightConfig& config() const noexcept {
        return config_;
    }

    [[nodiscard]] std::expected<void, PreflightError> validate(const io::ByteSource& content) const {
        return validate_archive(content, config_);
    }
};

}  // namespace fileguard::core
