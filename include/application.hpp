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
#include <optional>
#include <string>
#include <vector>

#include "validator_config.hpp"

struct CliOptions {
    std::optional<std::filesystem::path> config_path;
    std::vector<std::string> file_types;
    std::optional<std::string> max_size;
    bool no_preflight = false;
    std::optional<std::int64_t> max_entries;
    std::optional<double> max_ratio;
    bool allow_suspicious_paths = false;
    std::optional<std::filesystem::path> deny_hashes;
    bool clamscan = false;
    bool verbose = false;
    bool no_color = false;
    bool show_help = false;
    bool show_version = false;
    std::vector<std::filesystem::path> files;
};

namespace ExitCode {
constexpr int OK = 0;
constexpr int REJECTED = 1;
constexpr int USAGE = 2;
constexpr int INTERRUPTED = 130;
}  // namespace ExitCode

std::expected<CliOptions, std::string> parse_arguments(int argc, char* argv[]);

// Applies command line overrides on top of the configuration file (or the
// built-in defaults). Throws ConfigurationError for an invalid result.
fileguard::core::FileValidatorConfig make_config(const CliOptions& options);

class Application {
   public:
    int run(int argc, char* argv[]);

   private:
    void show_help(const std::string& app_name) const;
    void show_version() const;
};
