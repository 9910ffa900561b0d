/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/validator_config.hpp"

#include <format>
#include <fstream>
#include <limits>
#include <sstream>

#include <nlohmann/json.hpp>

#include "include/byte_size.hpp"
#include "include/file_signatures.hpp"
#include "include/utils.hpp"

namespace fileguard::core {

using json = nlohmann::json;

namespace {

std::unexpected<ConfigError> config_error(ConfigErrorKind kind, std::string message) {
    return std::unexpected(ConfigError{kind, std::move(message)});
}

std::unexpected<ConfigError> bad_type(std::string_view key, std::string_view expected) {
    return config_error(ConfigErrorKind::InvalidFormat,
                        std::format("'{}' must be {}", key, expected));
}

// JSON integers above INT64_MAX arrive as unsigned and would wrap on conversion.
std::expected<std::int64_t, ConfigError> integer_from(const json& value, std::string_view key) {
    if (value.is_number_unsigned() &&
        value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return config_error(ConfigErrorKind::InvalidLimit,
                            std::format("'{}' is out of range: {}", key, value.dump()));
    }
    return value.get<std::int64_t>();
}

// Integer bytes, a byte-size string, null or -1.
std::expected<Limit<std::int64_t>, ConfigError> size_limit_from(const json& value, std::string_view key) {
    if (value.is_null()) {
        return Limit<std::int64_t>::unlimited();
    }
    if (value.is_number_integer()) {
        auto raw = integer_from(value, key);
        if (!raw)
            return std::unexpected(raw.error());
        return Limit<std::int64_t>::from_raw(*raw);
    }
    if (value.is_string()) {
        auto bytes = parse_byte_size(value.get<std::string>());
        if (!bytes) {
            return config_error(ConfigErrorKind::InvalidLimit, std::format("'{}': {}", key, bytes.error()));
        }
        return Limit<std::int64_t>::of(*bytes);
    }
    return bad_type(key, "an integer, a size string or null");
}

std::expected<Limit<std::int64_t>, ConfigError> count_limit_from(const json& value, std::string_view key) {
    if (value.is_null()) {
        return Limit<std::int64_t>::unlimited();
    }
    if (value.is_number_integer()) {
        auto raw = integer_from(value, key);
        if (!raw)
            return std::unexpected(raw.error());
        return Limit<std::int64_t>::from_raw(*raw);
    }
    return bad_type(key, "an integer or null");
}

std::expected<Limit<double>, ConfigError> rate_limit_from(const json& value, std::string_view key) {
    if (value.is_null()) {
        return Limit<double>::unlimited();
    }
    if (value.is_number()) {
        return Limit<double>::from_raw(value.get<double>());
    }
    return bad_type(key, "a number or null");
}

std::expected<bool, ConfigError> bool_from(const json& value, std::string_view key) {
    if (!value.is_boolean()) {
        return bad_type(key, "a boolean");
    }
    return value.get<bool>();
}

std::expected<PreflightConfig, ConfigError> preflight_from(const json& node) {
    if (!node.is_object()) {
        return bad_type("zipPreflight", "an object");
    }

    PreflightConfig cfg;

    if (node.contains("enabled")) {
        auto v = bool_from(node["enabled"], "zipPreflight.enabled");
        if (!v)
            return std::unexpected(v.error());
        cfg.enabled = *v;
    }
    if (node.contains("maxEntries")) {
        auto v = count_limit_from(node["maxEntries"], "zipPreflight.maxEntries");
        if (!v)
            return std::unexpected(v.error());
        cfg.max_entries = *v;
    }
    if (node.contains("totalUncompressedSizeLimit")) {
        auto v = size_limit_from(node["totalUncompressedSizeLimit"], "zipPreflight.totalUncompressedSizeLimit");
        if (!v)
            return std::unexpected(v.error());
        cfg.total_uncompressed_size_limit = *v;
    }
    if (node.contains("entryUncompressedSizeLimit")) {
        auto v = size_limit_from(node["entryUncompressedSizeLimit"], "zipPreflight.entryUncompressedSizeLimit");
        if (!v)
            return std::unexpected(v.error());
        cfg.entry_uncompressed_size_limit = *v;
    }
    if (node.contains("compressionRateLimit")) {
        auto v = rate_limit_from(node["compressionRateLimit"], "zipPreflight.compressionRateLimit");
        if (!v)
            return std::unexpected(v.error());
        cfg.compression_rate_limit = *v;
    }
    if (node.contains("rejectSuspiciousPaths")) {
        auto v = bool_from(node["rejectSuspiciousPaths"], "zipPreflight.rejectSuspiciousPaths");
        if (!v)
            return std::unexpected(v.error());
        cfg.reject_suspicious_paths = *v;
    }

    return cfg;
}

}  // namespace

std::expected<void, ConfigError> validate_config(const FileValidatorConfig& config) {
    if (config.supported_file_types.empty()) {
        return config_error(ConfigErrorKind::MissingValue,
                            "At least one supported file type must be provided");
    }

    for (const auto& type : config.supported_file_types) {
        if (trim_sv(type).empty() || !type.starts_with('.')) {
            return config_error(
                ConfigErrorKind::InvalidFileType,
                std::format("Invalid file type '{}'. File types must start with a dot (e.g. '.pdf')", type));
        }
        if (!find_definition(type)) {
            return config_error(ConfigErrorKind::UnsupportedFileType,
                                std::format("File type '{}' is not supported", type));
        }
    }

    if (config.file_size_limit <= 0) {
        return config_error(ConfigErrorKind::InvalidLimit,
                            std::format("File size limit must be greater than zero (got {})",
                                        config.file_size_limit));
    }

    return validate_preflight_config(config.preflight);
}

ConfigBuilder& ConfigBuilder::allow_file_types(const std::vector<std::string>& file_types) {
    for (const auto& type : file_types) {
        config_.supported_file_types.push_back(to_lower(type));
    }
    return *this;
}

ConfigBuilder& ConfigBuilder::allow_file_types(std::initializer_list<std::string_view> file_types) {
    for (auto type : file_types) {
        config_.supported_file_types.push_back(to_lower(type));
    }
    return *this;
}

ConfigBuilder& ConfigBuilder::set_file_size_limit(std::string_view text) {
    auto bytes = parse_byte_size(text);
    if (!bytes) {
        throw ConfigurationError(ConfigError{ConfigErrorKind::InvalidLimit, bytes.error()});
    }
    config_.file_size_limit = *bytes;
    return *this;
}

ConfigBuilder& ConfigBuilder::add_malware_scanner(std::shared_ptr<const scan::MalwareScanner> scanner) {
    if (!scanner) {
        throw ConfigurationError(
            ConfigError{ConfigErrorKind::MissingValue, "Malware scanner cannot be null"});
    }
    config_.scanner = std::move(scanner);
    return *this;
}

FileValidatorConfig ConfigBuilder::build() const {
    if (auto r = validate_config(config_); !r) {
        throw ConfigurationError(r.error());
    }
    return config_;
}

std::expected<FileValidatorConfig, ConfigError> parse_config(std::string_view json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return config_error(ConfigErrorKind::InvalidFormat, std::format("Invalid JSON: {}", e.what()));
    }

    if (!root.is_object()) {
        return bad_type("configuration", "a JSON object");
    }

    FileValidatorConfig cfg;

    if (root.contains("supportedFileTypes")) {
        const auto& types = root["supportedFileTypes"];
        if (!types.is_array()) {
            return bad_type("supportedFileTypes", "an array of strings");
        }
        for (const auto& type : types) {
            if (!type.is_string()) {
                return bad_type("supportedFileTypes", "an array of strings");
            }
            cfg.supported_file_types.push_back(to_lower(type.get<std::string>()));
        }
    }

    if (root.contains("fileSizeLimit")) {
        const auto& limit = root["fileSizeLimit"];
        if (limit.is_number_integer()) {
            auto raw = integer_from(limit, "fileSizeLimit");
            if (!raw)
                return std::unexpected(raw.error());
            cfg.file_size_limit = *raw;
        } else if (limit.is_string()) {
            auto bytes = parse_byte_size(limit.get<std::string>());
            if (!bytes) {
                return config_error(ConfigErrorKind::InvalidLimit,
                                    std::format("'fileSizeLimit': {}", bytes.error()));
            }
            cfg.file_size_limit = *bytes;
        } else {
            return bad_type("fileSizeLimit", "an integer or a size string");
        }
    }

    if (root.contains("throwOnInvalidFile")) {
        auto v = bool_from(root["throwOnInvalidFile"], "throwOnInvalidFile");
        if (!v)
            return std::unexpected(v.error());
        cfg.throw_on_invalid_file = *v;
    }

    if (root.contains("zipPreflight")) {
        auto preflight = preflight_from(root["zipPreflight"]);
        if (!preflight)
            return std::unexpected(preflight.error());
        cfg.preflight = *preflight;
    }

    if (auto r = validate_config(cfg); !r) {
        return std::unexpected(r.error());
    }
    return cfg;
}

std::expected<FileValidatorConfig, ConfigError> load_config_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return config_error(ConfigErrorKind::InvalidFormat,
                            std::format("Cannot open configuration file '{}'", path.string()));
    }

    std::ostringstream text;
    text << in.rdbuf();
    if (in.bad()) {
        return config_error(ConfigErrorKind::InvalidFormat,
                            std::format("Failed to read configuration file '{}'", path.string()));
    }

    auto cfg = parse_config(text.str());
    if (!cfg) {
        return std::unexpected(ConfigError{cfg.error().kind,
                                           std::format("{}: {}", path.string(), cfg.error().message)});
    }
    return cfg;
}

}  // namespace fileguard::core
