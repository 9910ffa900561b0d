/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <limits>
#include <memory>
#include <string>
#include <vector>
#include <unistd.h>

#include "include/byte_size.hpp"
#include "include/validator_config.hpp"

using namespace fileguard;
using core::ConfigBuilder;
using core::ConfigErrorKind;
using core::ConfigurationError;

TEST(ValidatorConfig, RequiresAtLeastOneType) {
    core::FileValidatorConfig cfg;
    auto r = core::validate_config(cfg);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ConfigErrorKind::MissingValue);
    EXPECT_EQ(r.error().message, "At least one supported file type must be provided");
}

TEST(ValidatorConfig, TypesMustBeDottedAndKnown) {
    core::FileValidatorConfig cfg;
    cfg.supported_file_types = {"pdf"};
    auto r = core::validate_config(cfg);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ConfigErrorKind::InvalidFileType);

    cfg.supported_file_types = {".exe"};
    r = core::validate_config(cfg);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ConfigErrorKind::UnsupportedFileType);
}

TEST(ValidatorConfig, FileSizeLimitMustBePositive) {
    core::FileValidatorConfig cfg;
    cfg.supported_file_types = {".pdf"};
    cfg.file_size_limit = 0;
    auto r = core::validate_config(cfg);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ConfigErrorKind::InvalidLimit);
}

TEST(ValidatorConfig, PreflightErrorsSurface) {
    core::FileValidatorConfig cfg;
    cfg.supported_file_types = {".docx"};
    cfg.preflight.compression_rate_limit = core::Limit<double>::of(-3.0);
    auto r = core::validate_config(cfg);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ConfigErrorKind::InvalidLimit);
}

TEST(ConfigBuilder, BuildsLowerCasedConfig) {
    auto cfg = ConfigBuilder()
                   .allow_file_types({".PDF", ".Docx"})
                   .set_file_size_limit("10 MB")
                   .throw_on_invalid_files(false)
                   .build();

    EXPECT_EQ(cfg.supported_file_types, (std::vector<std::string>{".pdf", ".docx"}));
    EXPECT_EQ(cfg.file_size_limit, core::megabytes(10));
    EXPECT_FALSE(cfg.throw_on_invalid_file);
    EXPECT_EQ(cfg.scanner, nullptr);
}

TEST(ConfigBuilder, InvalidSizeStringThrows) {
    ConfigBuilder builder;
    try {
        builder.set_file_size_limit("ten megs");
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.error().kind, ConfigErrorKind::InvalidLimit);
    }
}

TEST(ConfigBuilder, NullScannerThrows) {
    EXPECT_THROW(ConfigBuilder().add_malware_scanner(nullptr), ConfigurationError);
}

TEST(ConfigBuilder, BuildValidates) {
    EXPECT_THROW((void)ConfigBuilder().build(), ConfigurationError);
    EXPECT_THROW((void)ConfigBuilder().allow_file_types({".pdf"}).set_file_size_limit(-1).build(),
                 ConfigurationError);
}

TEST(ConfigBuilder, KeepsScanner) {
    auto scanner = std::make_shared<scan::HashDenyListScanner>();
    auto cfg = ConfigBuilder().allow_file_types({".pdf"}).add_malware_scanner(scanner).build();
    ASSERT_NE(cfg.scanner, nullptr);
    EXPECT_EQ(cfg.scanner->name(), "sha256-deny-list");
}

TEST(ParseConfig, ReadsAllKeys) {
    auto cfg = core::parse_config(R"({
        "supportedFileTypes": [".PDF", ".docx", ".odt"],
        "fileSizeLimit": "5 MB",
        "throwOnInvalidFile": false,
        "zipPreflight": {
            "enabled": true,
            "maxEntries": 500,
            "totalUncompressedSizeLimit": "100 MB",
            "entryUncompressedSizeLimit": 1048576,
            "compressionRateLimit": 50.5,
            "rejectSuspiciousPaths": false
        }
    })");
    ASSERT_TRUE(cfg) << cfg.error().message;

    EXPECT_EQ(cfg->supported_file_types, (std::vector<std::string>{".pdf", ".docx", ".odt"}));
    EXPECT_EQ(cfg->file_size_limit, core::megabytes(5));
    EXPECT_FALSE(cfg->throw_on_invalid_file);
    EXPECT_EQ(cfg->preflight.max_entries.value(), 500);
    EXPECT_EQ(cfg->preflight.total_uncompressed_size_limit.value(), core::megabytes(100));
    EXPECT_EQ(cfg->preflight.entry_uncompressed_size_limit.value(), 1048576);
    EXPECT_DOUBLE_EQ(cfg->preflight.compression_rate_limit.value(), 50.5);
    EXPECT_FALSE(cfg->preflight.reject_suspicious_paths);
}

TEST(ParseConfig, NullAndMinusOneMeanUnlimited) {
    auto cfg = core::parse_config(R"({
        "supportedFileTypes": [".xlsx"],
        "zipPreflight": {
            "maxEntries": -1,
            "totalUncompressedSizeLimit": null,
            "entryUncompressedSizeLimit": -1,
            "compressionRateLimit": null
        }
    })");
    ASSERT_TRUE(cfg) << cfg.error().message;
    EXPECT_FALSE(cfg->preflight.max_entries.is_set());
    EXPECT_FALSE(cfg->preflight.total_uncompressed_size_limit.is_set());
    EXPECT_FALSE(cfg->preflight.entry_uncompressed_size_limit.is_set());
    EXPECT_FALSE(cfg->preflight.compression_rate_limit.is_set());
}

TEST(ParseConfig, DefaultsForMissingKeys) {
    auto cfg = core::parse_config(R"({"supportedFileTypes": [".pdf"]})");
    ASSERT_TRUE(cfg);
    EXPECT_EQ(cfg->file_size_limit, Config::DEFAULT_FILE_SIZE_LIMIT);
    EXPECT_TRUE(cfg->throw_on_invalid_file);
    EXPECT_TRUE(cfg->preflight.enabled);
}

TEST(ParseConfig, RejectsWrongTypes) {
    auto r = core::parse_config(R"({"supportedFileTypes": ".pdf"})");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ConfigErrorKind::InvalidFormat);

    r = core::parse_config(R"({"supportedFileTypes": [".pdf"], "zipPreflight": {"maxEntries": "many"}})");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ConfigErrorKind::InvalidFormat);
    EXPECT_NE(r.error().message.find("maxEntries"), std::string::npos);

    r = core::parse_config(R"({"supportedFileTypes": [".pdf"], "throwOnInvalidFile": "yes"})");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ConfigErrorKind::InvalidFormat);
}

TEST(ParseConfig, RejectsInvalidJsonAndValues) {
    auto r = core::parse_config("{ not json");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ConfigErrorKind::InvalidFormat);
    EXPECT_TRUE(r.error().message.starts_with("Invalid JSON"));

    r = core::parse_config(R"({"supportedFileTypes": [".docx"], "zipPreflight": {"maxEntries": 0}})");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ConfigErrorKind::InvalidLimit);

    r = core::parse_config(R"({"supportedFileTypes": []})");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ConfigErrorKind::MissingValue);
}

TEST(ParseConfig, RejectsIntegersBeyondSignedRange) {
    // 2^64 - 1 must not wrap around to the -1 "unlimited" sentinel.
    auto r = core::parse_config(
        R"({"supportedFileTypes": [".docx"], "zipPreflight": {"maxEntries": 18446744073709551615}})");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ConfigErrorKind::InvalidLimit);
    EXPECT_NE(r.error().message.find("maxEntries"), std::string::npos) << r.error().message;

    r = core::parse_config(
        R"({"supportedFileTypes": [".docx"], "zipPreflight": {"entryUncompressedSizeLimit": 18446744073709551614}})");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ConfigErrorKind::InvalidLimit);
    EXPECT_NE(r.error().message.find("out of range"), std::string::npos) << r.error().message;

    r = core::parse_config(R"({"supportedFileTypes": [".pdf"], "fileSizeLimit": 9223372036854775808})");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ConfigErrorKind::InvalidLimit);

    auto max = core::parse_config(
        R"({"supportedFileTypes": [".docx"], "zipPreflight": {"maxEntries": 9223372036854775807}})");
    ASSERT_TRUE(max) << max.error().message;
    EXPECT_EQ(max->preflight.max_entries.value(), std::numeric_limits<std::int64_t>::max());
}

TEST(LoadConfigFile, ReadsFileAndPrefixesErrors) {
    auto path = std::filesystem::temp_directory_path() /
                ("fileguard-config-" + std::to_string(::getpid()) + ".json");
    {
        std::ofstream out(path);
        out << R"({"supportedFileTypes": [".pdf"], "fileSizeLimit": 2048})";
    }
    auto cfg = core::load_config_file(path);
    ASSERT_TRUE(cfg);
    EXPECT_EQ(cfg->file_size_limit, 2048);

    {
        std::ofstream out(path);
        out << R"({"supportedFileTypes": ["pdf"]})";
    }
    auto bad = core::load_config_file(path);
    ASSERT_FALSE(bad);
    EXPECT_TRUE(bad.error().message.starts_with(path.string()));

    std::filesystem::remove(path);

    auto missing = core::load_config_file(path);
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().kind, ConfigErrorKind::InvalidFormat);
}
