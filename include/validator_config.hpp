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
#include <filesystem>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"
#include "malware_scanner.hpp"
#include "preflight_config.hpp"

namespace fileguard::core {

struct FileValidatorConfig {
    // Lower-case extensions including the dot, e.g. ".pdf".
    std::vector<std::string> supported_file_types;
    std::int64_t file_size_limit = Config::DEFAULT_FILE_SIZE_LIMIT;
    bool throw_on_invalid_file = true;
    PreflightConfig preflight;
    std::shared_ptr<const scan::MalwareScanner> scanner;
};

std::expected<void, ConfigError> validate_config(const FileValidatorConfig& config);

class ConfigBuilder {
    FileValidatorConfig config_;

   public:
    ConfigBuilder& allow_file_types(const std::vector<std::string>& file_types);
    ConfigBuilder& allow_file_types(std::initializer_list<std::string_view> file_types);

    ConfigBuilder& throw_on_invalid_files(bool should_throw = true) {
        config_.throw_on_invalid_file = should_throw;
        return *this;
    }

    ConfigBuilder& set_file_size_limit(std::int64_t bytes) {
        config_.file_size_limit = bytes;
        return *this;
    }

    // Accepts "25 MB" style strings. Throws ConfigurationError when unparsable.
    ConfigBuilder& set_file_size_limit(std::string_view text);

    ConfigBuilder& set_preflight(PreflightConfig preflight) {
        config_.preflight = preflight;
        return *this;
    }

    // Throws ConfigurationError for a null scanner.
    ConfigBuilder& add_malware_scanner(std::shared_ptr<const scan::MalwareScanner> scanner);

    // Throws ConfigurationError when the assembled configuration is invalid.
    [[nodiscard]] FileValidatorConfig build() const;
};

// JSON configuration, keys as in the documented sample:
// {
//   "supportedFileTypes": [".pdf", ".docx"],
//   "fileSizeLimit": "25 MB",
//   "throwOnInvalidFile": false,
//   "zipPreflight": { "enabled": true, "maxEntries": 10000, ... }
// }
// Limits take null or -1 for "unlimited". The result is validated.
std::expected<FileValidatorConfig, ConfigError> parse_config(std::string_view json_text);
std::expected<FileValidatorConfig, ConfigError> load_config_file(const std::filesystem::path& path);

}  // namespace fileguard::core
