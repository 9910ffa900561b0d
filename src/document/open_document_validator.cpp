/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/document_validators.hpp"

#include <algorithm>
#include <format>
#include <optional>
#include <vector>

#include "include/config.hpp"
#include "include/format_classifier.hpp"
#include "include/utils.hpp"
#include "include/xml_document.hpp"
#include "include/zip_directory.hpp"

namespace fileguard::document {

namespace {

constexpr std::string_view MANIFEST_PART = "META-INF/manifest.xml";
constexpr std::string_view CONTENT_PART = "content.xml";
constexpr std::string_view MIMETYPE_PART = "mimetype";

std::optional<std::string_view> mimetype_for(std::string_view extension) {
    if (iequals(extension, core::ext::ODT))
        return "application/vnd.oasis.opendocument.text";
    if (iequals(extension, core::ext::ODS))
        return "application/vnd.oasis.opendocument.spreadsheet";
    if (iequals(extension, core::ext::ODP))
        return "application/vnd.oasis.opendocument.presentation";
    return std::nullopt;
}

std::unexpected<DocumentError> fail(DocumentErrorKind kind, std::string message) {
    return std::unexpected(DocumentError{kind, std::move(message)});
}

std::expected<void, DocumentError> check_mimetype(archive::ZipDirectory& dir,
                                                  const std::vector<archive::ZipEntry>& entries,
                                                  std::string_view expected) {
    auto it = std::ranges::find_if(
        entries, [](const archive::ZipEntry& e) { return iequals(e.name, MIMETYPE_PART); });
    if (it == entries.end()) {
        return {};
    }

    if (it != entries.begin()) {
        return fail(DocumentErrorKind::BadMimetype, "'mimetype' must be the first entry");
    }
    if (it->compressed_size != it->uncompressed_size) {
        return fail(DocumentErrorKind::BadMimetype, "'mimetype' must be stored uncompressed");
    }

    auto value = dir.read_entry(*it, Config::ODF_MIMETYPE_MAX_BYTES);
    if (!value) {
        return fail(DocumentErrorKind::BadMimetype,
                    std::format("'mimetype' is unreadable: {}", archive::error_string(value.error())));
    }

    auto actual = trim_sv(*value);
    if (actual != expected) {
        return fail(DocumentErrorKind::BadMimetype,
                    std::format("'mimetype' is '{}', expected '{}'", actual, expected));
    }
    return {};
}

// A leading '/' names the package root and is allowed. A leading "../", a
// "..\\" anywhere, or a scheme or drive letter separator is refused.
bool is_unsafe_manifest_path(std::string_view path) {
    return path.starts_with("../") || path.contains("..\\") || path.contains(':');
}

std::expected<void, DocumentError> check_manifest(archive::ZipDirectory& dir,
                                                  const archive::ZipEntry& entry) {
    auto xml = dir.read_entry(entry, Config::STRUCTURE_PART_MAX_BYTES);
    if (!xml) {
        return fail(DocumentErrorKind::Archive, archive::error_string(xml.error()));
    }

    auto doc = XmlDocument::parse(*xml, MANIFEST_PART);
    if (!doc) {
        return fail(DocumentErrorKind::MalformedXml, doc.error());
    }

    std::optional<std::string> offending;
    doc->for_each_element([&](const xmlNode& node) {
        auto full_path = attribute(node, "full-path");
        if (full_path && is_unsafe_manifest_path(*full_path)) {
            offending = std::move(full_path);
            return false;
        }
        return true;
    });

    if (offending) {
        return fail(DocumentErrorKind::UnsafeManifestPath,
                    std::format("Manifest references unsafe path '{}'", *offending));
    }
    return {};
}

}  // namespace

std::expected<void, DocumentError> validate_open_document(std::string_view extension,
                                                          const io::ByteSource& content) {
    auto expected_mimetype = mimetype_for(extension);
    if (!expected_mimetype) {
        return fail(DocumentErrorKind::NotSupported,
                    std::format("'{}' is not an OpenDocument format", extension));
    }

    auto dir = archive::ZipDirectory::open(content);
    if (!dir) {
        return fail(DocumentErrorKind::Archive, archive::error_string(dir.error()));
    }
    auto entries = dir->read_all();
    if (!entries) {
        return fail(DocumentErrorKind::Archive, archive::error_string(entries.error()));
    }

    auto manifest = std::ranges::find_if(
        *entries, [](const archive::ZipEntry& e) { return e.name == MANIFEST_PART; });
    if (manifest == entries->end()) {
        return fail(DocumentErrorKind::MissingPart, std::format("Missing '{}'", MANIFEST_PART));
    }

    bool has_content = std::ranges::any_of(
        *entries, [](const archive::ZipEntry& e) { return iequals(e.name, CONTENT_PART); });
    if (!has_content) {
        return fail(DocumentErrorKind::MissingPart, std::format("Missing '{}'", CONTENT_PART));
    }

    if (auto r = check_mimetype(*dir, *entries, *expected_mimetype); !r) {
        return r;
    }

    return check_manifest(*dir, *manifest);
}

}  // namespace fileguard::document
