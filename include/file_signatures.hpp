/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "byte_source.hpp"

namespace fileguard::core {

using Signature = std::vector<std::byte>;

struct FileDefinition {
    std::string extension;
    std::vector<Signature> signatures;
    std::size_t signature_offset = 0;
    std::optional<std::size_t> subtype_offset;
    std::vector<Signature> subtype_signatures;
};

enum class SignatureError {
    EmptyContent,
    ContentTooShort,
    Mismatch,
    SubtypeMismatch,
    ReadFailed
};

std::string error_string(SignatureError err);

// Every format this library knows how to validate, built once per process.
[[nodiscard]] const std::vector<FileDefinition>& file_definitions();

[[nodiscard]] const FileDefinition* find_definition(std::string_view extension);

std::expected<void, SignatureError> check_signature(const FileDefinition& definition,
                                                    const io::ByteSource& content);

}  // namespace fileguard::core
