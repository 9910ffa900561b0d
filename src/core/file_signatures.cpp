/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/file_signatures.hpp"

#include <algorithm>
#include <initializer_list>

#include "include/config.hpp"
#include "include/format_classifier.hpp"
#include "include/utils.hpp"

namespace fileguard::core {

namespace {

Signature sig(std::initializer_list<unsigned char> bytes) {
    Signature out;
    out.reserve(bytes.size());
    for (unsigned char b : bytes) {
        out.push_back(static_cast<std::byte>(b));
    }
    return out;
}

std::vector<FileDefinition> build_definitions() {
    const Signature jpeg = sig({0xFF, 0xD8, 0xFF});
    const Signature ole_cfb = sig({0xD0, 0xCF, 0x11, 0xE0, 0xA1, 0xB1, 0x1A, 0xE1});
    const Signature zip_local = sig({0x50, 0x4B, 0x03, 0x04});  // PK\3\4
    const Signature ftyp = sig({0x66, 0x74, 0x79, 0x70});
    const Signature riff = sig({0x52, 0x49, 0x46, 0x46});

    std::vector<FileDefinition> defs;
    auto add = [&](std::string_view extension, std::vector<Signature> signatures) -> FileDefinition& {
        defs.push_back(FileDefinition{.extension = std::string(extension),
                                      .signatures = std::move(signatures)});
        return defs.back();
    };

    add(ext::JPEG, {jpeg});
    add(ext::JPG, {jpeg});
    add(ext::JPE, {jpeg});
    add(ext::PDF, {sig({0x25, 0x50, 0x44, 0x46, 0x2D})});  // %PDF-
    add(ext::PNG, {sig({0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A})});
    add(ext::BMP, {sig({0x42, 0x4D})});
    add(ext::DOC, {ole_cfb});
    add(ext::XLS, {ole_cfb});
    add(ext::DOCX, {zip_local});
    add(ext::XLSX, {zip_local});
    add(ext::PPTX, {zip_local});
    add(ext::ODT, {zip_local});
    add(ext::ODS, {zip_local});
    add(ext::ODP, {zip_local});
    add(ext::RTF, {sig({0x7B, 0x5C, 0x72, 0x74, 0x66, 0x31})});  // {\rtf1
    add(ext::MP3, {sig({0xFF, 0xFB}), sig({0xFF, 0xF2}), sig({0xFF, 0xF3}), sig({0x49, 0x44, 0x33})});

    // ISO base media: "ftyp" box at 4, major brand at 8.
    auto& m4a = add(ext::M4A, {ftyp});
    m4a.signature_offset = 4;
    m4a.subtype_offset = 8;
    m4a.subtype_signatures = {sig({0x4D, 0x34, 0x41, 0x20})};

    auto& mov = add(ext::MOV, {ftyp});
    mov.signature_offset = 4;
    mov.subtype_offset = 8;
    mov.subtype_signatures = {sig({0x71, 0x74, 0x20, 0x20})};

    auto& mp4 = add(ext::MP4, {ftyp});
    mp4.signature_offset = 4;
    mp4.subtype_offset = 8;
    mp4.subtype_signatures = {sig({0x6D, 0x6D, 0x70, 0x34}),
                              sig({0x6D, 0x70, 0x34, 0x32}),
                              sig({0x69, 0x73, 0x6F, 0x6D}),
                              sig({0x4D, 0x53, 0x4E, 0x56})};

    auto& avi = add(ext::AVI, {riff});
    avi.subtype_offset = 8;
    avi.subtype_signatures = {sig({0x41, 0x56, 0x49, 0x20})};

    auto& wav = add(ext::WAV, {riff});
    wav.subtype_offset = 8;
    wav.subtype_signatures = {sig({0x57, 0x41, 0x56, 0x45})};

    return defs;
}

std::size_t longest(const std::vector<Signature>& signatures) {
    std::size_t n = 0;
    for (const auto& s : signatures) {
        n = std::max(n, s.size());
    }
    return n;
}

// Reads `length` bytes at `offset`; ContentTooShort when the content ends first.
std::expected<std::vector<std::byte>, SignatureError> read_window(const io::ByteSource& content,
                                                                  std::size_t offset,
                                                                  std::size_t length) {
    if (content.size() < offset + length) {
        return std::unexpected(SignatureError::ContentTooShort);
    }

    std::vector<std::byte> window(length);
    if (auto r = content.read_exact(offset, window); !r) {
        return std::unexpected(SignatureError::ReadFailed);
    }
    return window;
}

bool matches_any(std::span<const std::byte> window, const std::vector<Signature>& signatures) {
    return std::ranges::any_of(signatures, [&](const Signature& s) {
        return s.size() <= window.size() && std::ranges::equal(window.first(s.size()), s);
    });
}

// PDF producers may emit junk before the header; accept "%PDF-" anywhere in the first 1 KiB.
std::expected<void, SignatureError> check_pdf(const FileDefinition& definition,
                                              const io::ByteSource& content) {
    std::vector<std::byte> head(
        static_cast<std::size_t>(std::min<std::uint64_t>(content.size(), Config::PDF_SIGNATURE_SCAN_LENGTH)));
    if (auto r = content.read_exact(0, head); !r) {
        return std::unexpected(SignatureError::ReadFailed);
    }

    const Signature& marker = definition.signatures.front();
    if (std::ranges::search(head, marker).empty()) {
        return std::unexpected(SignatureError::Mismatch);
    }
    return {};
}

}  // namespace

std::string error_string(SignatureError err) {
    switch (err) {
        case SignatureError::EmptyContent:
            return "File content is empty";
        case SignatureError::ContentTooShort:
            return "File content is too short to contain a valid signature";
        case SignatureError::Mismatch:
            return "File signature does not match its extension";
        case SignatureError::SubtypeMismatch:
            return "File subtype signature does not match its extension";
        case SignatureError::ReadFailed:
            return "Failed to read file signature";
        default:
            return "Unknown signature error";
    }
}

const std::vector<FileDefinition>& file_definitions() {
    static const std::vector<FileDefinition> definitions = build_definitions();
    return definitions;
}

const FileDefinition* find_definition(std::string_view extension) {
    const auto& defs = file_definitions();
    auto it = std::ranges::find_if(defs, [&](const FileDefinition& d) {
        return iequals(d.extension, extension);
    });
    return it == defs.end() ? nullptr : &*it;
}

std::expected<void, SignatureError> check_signature(const FileDefinition& definition,
                                                    const io::ByteSource& content) {
    if (content.empty()) {
        return std::unexpected(SignatureError::EmptyContent);
    }

    if (definition.extension == ext::PDF) {
        return check_pdf(definition, content);
    }

    auto primary = read_window(content, definition.signature_offset, longest(definition.signatures));
    if (!primary) {
        return std::unexpected(primary.error());
    }
    if (!matches_any(*primary, definition.signatures)) {
        return std::unexpected(SignatureError::Mismatch);
    }

    if (definition.subtype_offset) {
        auto subtype =
            read_window(content, *definition.subtype_offset, longest(definition.subtype_signatures));
        if (!subtype) {
            return std::unexpected(subtype.error());
        }
        if (!matches_any(*subtype, definition.subtype_signatures)) {
            return std::unexpected(SignatureError::SubtypeMismatch);
        }
    }

    return {};
}

}  // namespace fileguard::core
