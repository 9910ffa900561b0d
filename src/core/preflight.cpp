/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/preflight.hpp"

#include <algorithm>
#include <format>
#include <limits>
#include <utility>

#include "include/path_safety.hpp"
#include "include/zip_directory.hpp"

namespace fileguard::core {

namespace {

constexpr std::int64_t INT64_CEILING = std::numeric_limits<std::int64_t>::max();

std::unexpected<PreflightError> limit_exceeded(PreflightViolation violation,
                                               std::string reason,
                                               std::string entry_name = {}) {
    return std::unexpected(PreflightError{
        PreflightErrorKind::LimitExceeded, violation, std::move(reason), std::move(entry_name)});
}

ArchiveEntryMetadata to_metadata(archive::ZipEntry&& entry) {
    return ArchiveEntryMetadata{
        .name = std::move(entry.name),
        .uncompressed_size = static_cast<std::int64_t>(entry.uncompressed_size),
        .compressed_size = static_cast<std::int64_t>(entry.compressed_size),
    };
}

}  // namespace

std::string error_string(PreflightErrorKind kind) {
    switch (kind) {
        case PreflightErrorKind::InvalidInput:
            return "Invalid input";
        case PreflightErrorKind::MalformedArchive:
            return "Invalid ZIP container";
        case PreflightErrorKind::LimitExceeded:
            return "ZIP container violates a safety limit";
        default:
            return "Unknown preflight error";
    }
}

std::string error_string(PreflightViolation violation) {
    switch (violation) {
        case PreflightViolation::None:
            return "none";
        case PreflightViolation::EntryCount:
            return "entry count exceeds configured maximum";
        case PreflightViolation::SuspiciousPath:
            return "suspicious entry path";
        case PreflightViolation::CorruptSizeMetadata:
            return "invalid entry size metadata";
        case PreflightViolation::EntrySize:
            return "entry uncompressed size exceeds limit";
        case PreflightViolation::TotalSize:
            return "total uncompressed size exceeds limit";
        case PreflightViolation::CompressionRatio:
            return "compression ratio exceeds limit";
        default:
            return "unknown violation";
    }
}

std::expected<void, PreflightError> check_entry(const ArchiveEntryMetadata& entry,
                                                const PreflightConfig& config,
                                                std::int64_t& running_total) {
    if (config.reject_suspicious_paths && is_suspicious_entry_name(entry.name)) {
        return limit_exceeded(PreflightViolation::SuspiciousPath,
                              std::format("Suspicious ZIP entry path: '{}'", entry.name),
                              entry.name);
    }

    const std::int64_t uncompressed = entry.uncompressed_size;
    const std::int64_t compressed = entry.compressed_size;

    if (uncompressed < 0 || compressed < 0) {
        return limit_exceeded(PreflightViolation::CorruptSizeMetadata,
                              std::format("'{}' has invalid size metadata", entry.name),
                              entry.name);
    }

    if (config.entry_uncompressed_size_limit.exceeded_by(uncompressed)) {
        return limit_exceeded(PreflightViolation::EntrySize,
                              std::format("'{}' too large uncompressed ({} > {})",
                                          entry.name,
                                          uncompressed,
                                          config.entry_uncompressed_size_limit.value()),
                              entry.name);
    }

    // Saturate rather than wrap; an unlimited total has nothing to compare against anyway.
    running_total = uncompressed > INT64_CEILING - running_total ? INT64_CEILING
                                                                 : running_total + uncompressed;
    if (config.total_uncompressed_size_limit.exceeded_by(running_total)) {
        return limit_exceeded(PreflightViolation::TotalSize,
                              std::format("ZIP total uncompressed too large ({} > {}) at '{}'",
                                          running_total,
                                          config.total_uncompressed_size_limit.value(),
                                          entry.name),
                              entry.name);
    }

    if (uncompressed > 0) {
        if (compressed == 0) {
            return limit_exceeded(
                PreflightViolation::CorruptSizeMetadata,
                std::format("'{}' has 0 compressed bytes but {} uncompressed bytes",
                            entry.name,
                            uncompressed),
                entry.name);
        }

        double ratio = static_cast<double>(uncompressed) / static_cast<double>(compressed);
        if (config.compression_rate_limit.exceeded_by(ratio)) {
            return limit_exceeded(PreflightViolation::CompressionRatio,
                                  std::format("'{}' compression ratio too high ({:.1f}:1 > {:.1f}:1)",
                                              entry.name,
                                              ratio,
                                              config.compression_rate_limit.value()),
                                  entry.name);
        }
    }

    return {};
}

std::expected<void, PreflightError> validate_archive(const io::ByteSource& content,
                                                     const PreflightConfig& config) {
    if (!config.enabled) {
        return {};
    }

    if (content.empty()) {
        return std::unexpected(PreflightError{
            PreflightErrorKind::InvalidInput, PreflightViolation::None, "Content is empty", {}});
    }

    auto directory = archive::ZipDirectory::open(content);
    if (!directory) {
        return std::unexpected(PreflightError{PreflightErrorKind::MalformedArchive,
                                              PreflightViolation::None,
                                              archive::error_string(directory.error()),
                                              {}});
    }

    auto declared = static_cast<std::int64_t>(
        std::min<std::uint64_t>(directory->entry_count(), static_cast<std::uint64_t>(INT64_CEILING)));
    if (config.max_entries.exceeded_by(declared)) {
        return limit_exceeded(PreflightViolation::EntryCount,
                              std::format("The total count of entries ({}) exceeds the defined maximum of {}",
                                          declared,
                                          config.max_entries.value()));
    }

    std::int64_t running_total = 0;
    while (true) {
        auto entry = directory->next();
        if (!entry) {
            return std::unexpected(PreflightError{PreflightErrorKind::MalformedArchive,
                                                  PreflightViolation::None,
                                                  archive::error_string(entry.error()),
                                                  {}});
        }
        if (!entry->has_value())
            break;

        if (auto r = check_entry(to_metadata(std::move(**entry)), config, running_total); !r) {
            return r;
        }
    }

    return {};
}

std::expected<ArchivePreflight, ConfigError> ArchivePreflight::create(PreflightConfig config) {
    if (auto r = validate_preflight_config(config); !r) {
        return std::unexpected(r.error());
    }
    return ArchivePreflight(std::move(config));
}

}  // namespace fileguard::core
