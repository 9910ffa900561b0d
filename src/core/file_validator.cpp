/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/file_validator.hpp"

#include <algorithm>
#include <cstdint>
#include <format>

#include "include/document_validators.hpp"
#include "include/file_signatures.hpp"
#include "include/format_classifier.hpp"
#include "include/utils.hpp"

namespace fileguard::core {

namespace {

std::unexpected<ValidationError> reject(ValidationErrorKind kind, std::string message) {
    return std::unexpected(ValidationError{kind, std::move(message), std::nullopt});
}

FileValidatorConfig validated(FileValidatorConfig config) {
    if (auto r = validate_config(config); !r) {
        throw ConfigurationError(r.error());
    }
    return config;
}

ArchivePreflight make_preflight(const PreflightConfig& config) {
    auto preflight = ArchivePreflight::create(config);
    if (!preflight) {
        throw ConfigurationError(preflight.error());
    }
    return std::move(*preflight);
}

}  // namespace

std::string error_string(ValidationErrorKind kind) {
    switch (kind) {
        case ValidationErrorKind::UnsupportedFileType:
            return "File type is not supported";
        case ValidationErrorKind::EmptyFile:
            return "File is empty";
        case ValidationErrorKind::FileTooLarge:
            return "File exceeds the size limit";
        case ValidationErrorKind::InvalidSignature:
            return "File signature is invalid";
        case ValidationErrorKind::PreflightFailed:
            return "Archive failed preflight";
        case ValidationErrorKind::InvalidOpenXml:
            return "Invalid Open XML document";
        case ValidationErrorKind::InvalidOpenDocument:
            return "Invalid OpenDocument file";
        case ValidationErrorKind::MalwareDetected:
            return "Malware detected";
        case ValidationErrorKind::ScannerFailed:
            return "Malware scan failed";
        case ValidationErrorKind::Unreadable:
            return "File could not be read";
        default:
            return "Unknown validation error";
    }
}

std::string_view to_string(Stage stage) noexcept {
    switch (stage) {
        case Stage::FileType:
            return "file type";
        case Stage::Size:
            return "size";
        case Stage::Signature:
            return "signature";
        case Stage::Preflight:
            return "zip preflight";
        case Stage::Structure:
            return "document structure";
        case Stage::MalwareScan:
            return "malware scan";
        default:
            return "unknown";
    }
}

FileValidator::FileValidator(FileValidatorConfig config)
    : config_(validated(std::move(config))), preflight_(make_preflight(config_.preflight)) {}

std::expected<void, ValidationError> FileValidator::check_file_type(std::string_view extension) const {
    bool allowed = !extension.empty() &&
                   std::ranges::any_of(config_.supported_file_types,
                                       [&](const std::string& t) { return iequals(t, extension); }) &&
                   find_definition(extension) != nullptr;
    if (!allowed) {
        return reject(ValidationErrorKind::UnsupportedFileType,
                      extension.empty() ? std::string("File has no extension")
                                        : std::format("File type '{}' is not allowed", extension));
    }
    return {};
}

std::expected<void, ValidationError> FileValidator::check_size(const io::ByteSource& content) const {
    if (content.empty()) {
        return reject(ValidationErrorKind::EmptyFile, "File is empty");
    }
    if (content.size() > static_cast<std::uint64_t>(config_.file_size_limit)) {
        return reject(ValidationErrorKind::FileTooLarge,
                      std::format("File size {} exceeds the limit of {}",
                                  format_bytes(content.size()),
                                  format_bytes(static_cast<std::uint64_t>(config_.file_size_limit))));
    }
    return {};
}

std::expected<void, ValidationError> FileValidator::check_signature(std::string_view extension,
                                                                    const io::ByteSource& content) const {
    const FileDefinition* definition = find_definition(extension);
    if (!definition) {
        return reject(ValidationErrorKind::UnsupportedFileType,
                      std::format("No signature known for '{}'", extension));
    }

    if (auto r = core::check_signature(*definition, content); !r) {
        return reject(ValidationErrorKind::InvalidSignature, error_string(r.error()));
    }
    return {};
}

std::expected<void, ValidationError> FileValidator::check_preflight(const io::ByteSource& content) const {
    auto r = preflight_.validate(content);
    if (!r) {
        return std::unexpected(
            ValidationError{ValidationErrorKind::PreflightFailed, r.error().reason, r.error()});
    }
    return {};
}

std::expected<void, ValidationError> FileValidator::check_open_xml(std::string_view extension,
                                                                   const io::ByteSource& content) const {
    if (auto r = document::validate_open_xml(extension, content); !r) {
        return reject(ValidationErrorKind::InvalidOpenXml, r.error().message);
    }
    return {};
}

std::expected<void, ValidationError> FileValidator::check_open_document(
    std::string_view extension, const io::ByteSource& content) const {
    if (auto r = document::validate_open_document(extension, content); !r) {
        return reject(ValidationErrorKind::InvalidOpenDocument, r.error().message);
    }
    return {};
}

std::expected<void, ValidationError> FileValidator::check_malware(std::string_view file_name,
                                                                  const io::ByteSource& content) const {
    if (!config_.scanner) {
        return reject(ValidationErrorKind::ScannerFailed, "No malware scanner is configured");
    }

    auto verdict = config_.scanner->scan(content, file_name);
    if (!verdict) {
        return reject(ValidationErrorKind::ScannerFailed,
                      std::format("{}: {}", config_.scanner->name(), verdict.error()));
    }
    if (*verdict == scan::ScanVerdict::Infected) {
        return reject(ValidationErrorKind::MalwareDetected,
                      std::format("{} flagged '{}' as malicious", config_.scanner->name(), file_name));
    }
    return {};
}

std::expected<void, ValidationError> FileValidator::observe(
    Stage stage, std::expected<void, ValidationError> result) const {
    if (observer_) {
        observer_(stage, result);
    }
    return result;
}

bool FileValidator::present(const std::expected<void, ValidationError>& result) const {
    if (result) {
        return true;
    }
    if (config_.throw_on_invalid_file) {
        throw FileValidationException(result.error());
    }
    return false;
}

std::expected<void, ValidationError> FileValidator::validate(std::string_view file_name,
                                                             const io::ByteSource& content) const {
    const std::string extension = extension_of(file_name);

    if (auto r = observe(Stage::FileType, check_file_type(extension)); !r)
        return r;
    if (auto r = observe(Stage::Size, check_size(content)); !r)
        return r;
    if (auto r = observe(Stage::Signature, check_signature(extension, content)); !r)
        return r;

    if (requires_preflight(extension)) {
        if (auto r = observe(Stage::Preflight, check_preflight(content)); !r)
            return r;
    }

    if (is_open_xml_format(extension)) {
        if (auto r = observe(Stage::Structure, check_open_xml(extension, content)); !r)
            return r;
    } else if (is_open_document_format(extension)) {
        if (auto r = observe(Stage::Structure, check_open_document(extension, content)); !r)
            return r;
    }

    if (config_.scanner) {
        if (auto r = observe(Stage::MalwareScan, check_malware(file_name, content)); !r)
            return r;
    }

    return {};
}

std::expected<void, ValidationError> FileValidator::validate(const std::filesystem::path& path) const {
    auto source = io::FileByteSource::open(path);
    if (!source) {
        return reject(ValidationErrorKind::Unreadable,
                      std::format("{}: {}", path.string(), io::error_string(source.error())));
    }
    return validate(path.filename().string(), *source);
}

bool FileValidator::is_valid_file(std::string_view file_name, const io::ByteSource& content) const {
    return present(validate(file_name, content));
}

bool FileValidator::is_valid_file(const std::filesystem::path& path) const {
    return present(validate(path));
}

bool FileValidator::is_valid_file_type(std::string_view file_name) const {
    return present(check_file_type(extension_of(file_name)));
}

bool FileValidator::has_valid_size(const io::ByteSource& content) const {
    return present(check_size(content));
}

bool FileValidator::has_valid_signature(std::string_view file_name,
                                        const io::ByteSource& content) const {
    return present(check_signature(extension_of(file_name), content));
}

bool FileValidator::passes_preflight(const io::ByteSource& content) const {
    return present(check_preflight(content));
}

bool FileValidator::is_valid_open_xml_document(std::string_view file_name,
                                               const io::ByteSource& content) const {
    return present(check_open_xml(extension_of(file_name), content));
}

bool FileValidator::is_valid_open_document(std::string_view file_name,
                                           const io::ByteSource& content) const {
    return present(check_open_document(extension_of(file_name), content));
}

bool FileValidator::is_malware_clean(std::string_view file_name, const io::ByteSource& content) const {
    return present(check_malware(file_name, content));
}

}  // namespace fileguard::core
