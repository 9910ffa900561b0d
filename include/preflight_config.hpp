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
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "config.hpp"

namespace fileguard::core {

// Either "no limit" or a concrete bound. Whether the bound is acceptable is
// decided by validate_preflight_config(), not here.
template <typename T>
class Limit {
    std::optional<T> value_;

    constexpr explicit Limit(std::optional<T> value) noexcept : value_(value) {}

   public:
    constexpr Limit() noexcept = default;

    static constexpr Limit unlimited() noexcept {
        return Limit(std::nullopt);
    }

    static constexpr Limit of(T value) noexcept {
        return Limit(value);
    }

    // Maps the configuration-file sentinel (-1) to unlimited.
    static constexpr Limit from_raw(T raw) noexcept {
        return raw == static_cast<T>(Config::UNLIMITED_SENTINEL) ? unlimited() : of(raw);
    }

    [[nodiscard]] constexpr bool is_set() const noexcept {
        return value_.has_value();
    }

    [[nodiscard]] constexpr T value() const {
        return value_.value();
    }

    // True when a bound is set and `amount` is strictly above it.
    template <typename U>
    [[nodiscard]] constexpr bool exceeded_by(U amount) const noexcept {
        return value_.has_value() && amount > *value_;
    }

    friend constexpr bool operator==(const Limit&, const Limit&) = default;
};

struct PreflightConfig {
    bool enabled = true;
    Limit<std::int64_t> max_entries = Limit<std::int64_t>::of(Config::PREFLIGHT_MAX_ENTRIES);
    Limit<std::int64_t> total_uncompressed_size_limit =
        Limit<std::int64_t>::of(Config::PREFLIGHT_TOTAL_UNCOMPRESSED_LIMIT);
    Limit<std::int64_t> entry_uncompressed_size_limit =
        Limit<std::int64_t>::of(Config::PREFLIGHT_ENTRY_UNCOMPRESSED_LIMIT);
    Limit<double> compression_rate_limit =
        Limit<double>::of(Config::PREFLIGHT_COMPRESSION_RATE_LIMIT);
    bool reject_suspicious_paths = true;

    static PreflightConfig disabled() {
        PreflightConfig cfg;
        cfg.enabled = false;
        return cfg;
    }

    static PreflightConfig unlimited() {
        PreflightConfig cfg;
        cfg.max_entries = Limit<std::int64_t>::unlimited();
        cfg.total_uncompressed_size_limit = Limit<std::int64_t>::unlimited();
        cfg.entry_uncompressed_size_limit = Limit<std::int64_t>::unlimited();
        cfg.compression_rate_limit = Limit<double>::unlimited();
        cfg.reject_suspicious_paths = false;
        return cfg;
    }
};

enum class ConfigErrorKind {
    InvalidLimit,
    InvalidRelation,
    MissingValue,
    InvalidFileType,
    UnsupportedFileType,
    InvalidFormat
};

struct ConfigError {
    ConfigErrorKind kind;
    std::string message;
};

std::string error_string(ConfigErrorKind kind);

// Thrown where a configuration is consumed at construction time (builders,
// validator constructors); carries the structured error.
class ConfigurationError : public std::invalid_argument {
    ConfigError error_;

   public:
    explicit ConfigurationError(ConfigError error)
        : std::invalid_argument(error.message), error_(std::move(error)) {}

    [[nodiscard]] const ConfigError& error() const noexcept {
        return error_;
    }
};

// A disabled configuration is always valid, whatever its limits hold.
std::expected<void, ConfigError> validate_preflight_config(const PreflightConfig& config);

}  // namespace fileguard::core
