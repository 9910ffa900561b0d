/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <expected>
#include <string>
#include <string_view>

#include "byte_source.hpp"

namespace fileguard::document {

enum class DocumentErrorKind {
    NotSupported,
    MissingPart,
    MacrosNotAllowed,
    TemplateNotAllowed,
    AddInNotAllowed,
    BadMimetype,
    UnsafeManifestPath,
    MalformedXml,
    Archive
};

std::string error_string(DocumentErrorKind kind);

struct DocumentError {
    DocumentErrorKind kind;
    std::string message;
};

// Package structure of .docx/.xlsx/.pptx. The archive must already have passed preflight.
std::expected<void, DocumentError> validate_open_xml(std::string_view extension,
                                                     const io::ByteSource& content);

// Package structure of .odt/.ods/.odp. The archive must already have passed preflight.
std::expected<void, DocumentError> validate_open_document(std::string_view extension,
                                                          const io::ByteSource& content);

}  // namespace fileguard::document
