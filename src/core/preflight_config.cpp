/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/preflight_config.hpp"

#include <cmath>
#include <format>
#include <string_view>

namespace fileguard::core {

namespace {

std::expected<void, ConfigError> require_positive(const Limit<std::int64_t>& limit,
                                                  std::string_view field) {
    if (limit.is_set() && limit.value() <= 0) {
        return std::unexpected(ConfigError{
            ConfigErrorKind::InvalidLimit,
            std::format("{} must be greater than zero or unlimited (got {})", field, limit.value())});
    }
    return {};
}

}  // namespace

std::string error_string(ConfigErrorKind kind) {
    switch (kind) {
        case ConfigErrorKind::InvalidLimit:
            return "Invalid limit value";
        case ConfigErrorKind::InvalidRelation:
            return "Inconsistent limit values";
        case ConfigErrorKind::MissingValue:
            return "Missing required configuration value";
        case ConfigErrorKind::InvalidFileType:
            return "Invalid file type";
        case ConfigErrorKind::UnsupportedFileType:
            return "Unsupported file type";
        case ConfigErrorKind::InvalidFormat:
            return "Malformed configuration";
        default:
            return "Unknown configuration error";
    }
}

std::expected<void, ConfigError> validate_preflight_config(const PreflightConfig& config) {
    if (!config.enabled) {
        return {};
    }

    if (auto r = require_positive(config.max_entries, "maxEntries"); !r)
        return r;
    if (auto r = require_positive(config.total_uncompressed_size_limit, "totalUncompressedSizeLimit"); !r)
        return r;
    if (auto r = require_positive(config.entry_uncompressed_size_limit, "entryUncompressedSizeLimit"); !r)
        return r;

    if (config.compression_rate_limit.is_set()) {
        double rate = config.compression_rate_limit.value();
        if (!std::isfinite(rate) || rate <= 0.0) {
            return std::unexpected(ConfigError{
                ConfigErrorKind::InvalidLimit,
                std::format("compressionRateLimit must be a finite value greater than zero (got {})",
                            rate)});
        }
    }

    if (config.entry_uncompressed_size_limit.is_set() &&
        config.total_uncompressed_size_limit.is_set() &&
        config.entry_uncompressed_size_limit.value() > config.total_uncompressed_size_limit.value()) {
        return std::unexpected(ConfigError{
            ConfigErrorKind::InvalidRelation,
            std::format("entryUncompressedSizeLimit ({}) cannot exceed totalUncompressedSizeLimit ({})",
                        config.entry_uncompressed_size_limit.value(),
                        config.total_uncompressed_size_limit.value())});
    }

    return {};
}

}  // namespace fileguard::core
