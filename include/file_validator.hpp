/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "byte_source.hpp"
#include "preflight.hpp"
#include "validator_config.hpp"

namespace fileguard::core {

enum class ValidationErrorKind {
    UnsupportedFileType,
    EmptyFile,
    FileTooLarge,
    InvalidSignature,
    PreflightFailed,
    InvalidOpenXml,
    InvalidOpenDocument,
    MalwareDetected,
    ScannerFailed,
    Unreadable
};

std::string error_string(ValidationErrorKind kind);

struct ValidationError {
    ValidationErrorKind kind;
    std::string message;
    // Set for PreflightFailed.
    std::optional<PreflightError> preflight;
};

class FileValidationException : public std::runtime_error {
    ValidationError error_;

   public:
    explicit FileValidationException(ValidationError error)
        : std::runtime_error(error.message), error_(std::move(error)) {}

    [[nodiscard]] const ValidationError& error() const noexcept {
        return error_;
    }
};

enum class Stage { FileType, Size, Signature, Preflight, Structure, MalwareScan };

std::string_view to_string(Stage stage) noexcept;

// Runs the checks in a fixed order and stops at the first failure:
// file type, size, signature, ZIP preflight (archive-backed formats only),
// document structure, malware scan (when a scanner is configured).
// The configuration is validated once at construction and never changes,
// so a single instance may be shared between threads.
class FileValidator {
   public:
    using StageObserver = std::function<void(Stage, const std::expected<void, ValidationError>&)>;

   private:
    FileValidatorConfig config_;
    ArchivePreflight preflight_;
    StageObserver observer_;

    std::expected<void, ValidationError> check_file_type(std::string_view extension) const;
    std::expected<void, ValidationError> check_size(const io::ByteSource& content) const;
    std::expected<void, ValidationError> check_signature(std::string_view extension,
                                                         const io::ByteSource& content) const;
    std::expected<void, ValidationError> check_preflight(const io::ByteSource& content) const;
    std::expected<void, ValidationError> check_open_xml(std::string_view extension,
                                                        const io::ByteSource& content) const;
    std::expected<void, ValidationError> check_open_document(std::string_view extension,
                                                             const io::ByteSource& content) const;
    std::expected<void, ValidationError> check_malware(std::string_view file_name,
                                                       const io::ByteSource& content) const;

    std::expected<void, ValidationError> observe(Stage stage,
                                                 std::expected<void, ValidationError> result) const;

    // Throws or returns false according to throw_on_invalid_file.
    bool present(const std::expected<void, ValidationError>& result) const;

   public:
    // Throws ConfigurationError when `config` does not pass validate_config().
    explicit FileValidator(FileValidatorConfig config);

    [[nodiscard]] const FileValidatorConfig& config() const noexcept {
        return config_;
    }

    [[nodiscard]] const std::vector<std::string>& supported_file_types() const noexcept {
        return config_.supported_file_types;
    }

    // Called after every stage that runs. Set before sharing the validator.
    void set_stage_observer(StageObserver observer) {
        observer_ = std::move(observer);
    }

    [[nodiscard]] std::expected<void, ValidationError> validate(std::string_view file_name,
                                                                const io::ByteSource& content) const;
    [[nodiscard]] std::expected<void, ValidationError> validate(const std::filesystem::path& path) const;

    bool is_valid_file(std::string_view file_name, const io::ByteSource& content) const;
    bool is_valid_file(const std::filesystem::path& path) const;

    bool is_valid_file_type(std::string_view file_name) const;
    bool has_valid_size(const io::ByteSource& content) const;
    bool has_valid_signature(std::string_view file_name, const io::ByteSource& content) const;
    bool passes_preflight(const io::ByteSource& content) const;
    bool is_valid_open_xml_document(std::string_view file_name, const io::ByteSource& content) const;
    bool is_valid_open_document(std::string_view file_name, const io::ByteSource& content) const;
    bool is_malware_clean(std::string_view file_name, const io::ByteSource& content) const;
};

}  // namespace fileguard::core
