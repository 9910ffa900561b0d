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
#include <span>
#include <vector>

#include "include/config.hpp"
#include "include/format_classifier.hpp"
#include "include/utils.hpp"
#include "include/xml_document.hpp"
#include "include/zip_directory.hpp"

namespace fileguard::document {

namespace {

constexpr std::string_view CONTENT_TYPES_PART = "[Content_Types].xml";
constexpr std::string_view RELATIONSHIPS_PART = "_rels/.rels";
constexpr std::string_view VBA_PROJECT_PART = "vbaProject.bin";
constexpr std::string_view VBA_PROJECT_TYPE = "application/vnd.ms-office.vbaProject";

enum class PackageKind { Main, MacroEnabled, Template, AddIn };

struct MainPartType {
    std::string_view content_type;
    PackageKind kind;
};

// Main-part content types per host application, as written by Office.
constexpr MainPartType WORD_TYPES[] = {
    {"application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml",
     PackageKind::Main},
    {"application/vnd.ms-word.document.macroEnabled.main+xml", PackageKind::MacroEnabled},
    {"application/vnd.openxmlformats-officedocument.wordprocessingml.template.main+xml",
     PackageKind::Template},
    {"application/vnd.ms-word.template.macroEnabledTemplate.main+xml", PackageKind::Template},
};

constexpr MainPartType EXCEL_TYPES[] = {
    {"application/vnd.openxmlformats-officedocument.spreadsheetml.sheet.main+xml",
     PackageKind::Main},
    {"application/vnd.ms-excel.sheet.macroEnabled.main+xml", PackageKind::MacroEnabled},
    {"application/vnd.ms-excel.addin.macroEnabled.main+xml", PackageKind::AddIn},
    {"application/vnd.openxmlformats-officedocument.spreadsheetml.template.main+xml",
     PackageKind::Template},
    {"application/vnd.ms-excel.template.macroEnabled.main+xml", PackageKind::Template},
};

constexpr MainPartType POWERPOINT_TYPES[] = {
    {"application/vnd.openxmlformats-officedocument.presentationml.presentation.main+xml",
     PackageKind::Main},
    {"application/vnd.openxmlformats-officedocument.presentationml.slideshow.main+xml",
     PackageKind::Main},
    {"application/vnd.ms-powerpoint.presentation.macroEnabled.main+xml", PackageKind::MacroEnabled},
    {"application/vnd.ms-powerpoint.slideshow.macroEnabled.main+xml", PackageKind::MacroEnabled},
    {"application/vnd.ms-powerpoint.addin.macroEnabled.main+xml", PackageKind::AddIn},
    {"application/vnd.openxmlformats-officedocument.presentationml.template.main+xml",
     PackageKind::Template},
    {"application/vnd.ms-powerpoint.template.macroEnabled.main+xml", PackageKind::Template},
};

struct Host {
    std::span<const MainPartType> types;
    std::string_view noun;
};

std::optional<Host> host_for(std::string_view extension) {
    if (iequals(extension, core::ext::DOCX))
        return Host{WORD_TYPES, "Document"};
    if (iequals(extension, core::ext::XLSX))
        return Host{EXCEL_TYPES, "Spreadsheet"};
    if (iequals(extension, core::ext::PPTX))
        return Host{POWERPOINT_TYPES, "Presentation"};
    return std::nullopt;
}

struct Override {
    std::string part_name;
    std::string content_type;
};

struct ContentTypes {
    std::vector<Override> overrides;
    bool declares_vba = false;
};

std::unexpected<DocumentError> fail(DocumentErrorKind kind, std::string message) {
    return std::unexpected(DocumentError{kind, std::move(message)});
}

std::unexpected<DocumentError> archive_failure(archive::ArchiveError err) {
    return fail(DocumentErrorKind::Archive, archive::error_string(err));
}

std::expected<ContentTypes, DocumentError> read_content_types(archive::ZipDirectory& dir,
                                                              const archive::ZipEntry& entry) {
    auto xml = dir.read_entry(entry, Config::STRUCTURE_PART_MAX_BYTES);
    if (!xml) {
        return archive_failure(xml.error());
    }

    auto doc = XmlDocument::parse(*xml, CONTENT_TYPES_PART);
    if (!doc) {
        return fail(DocumentErrorKind::MalformedXml, doc.error());
    }
    if (local_name(*doc->root()) != "Types") {
        return fail(DocumentErrorKind::MalformedXml,
                    std::format("'{}' has no <Types> root", CONTENT_TYPES_PART));
    }

    ContentTypes types;
    doc->for_each_element([&](const xmlNode& node) {
        auto name = local_name(node);
        auto content_type = attribute(node, "ContentType").value_or("");
        if (iequals(content_type, VBA_PROJECT_TYPE)) {
            types.declares_vba = true;
        }
        if (name == "Override") {
            types.overrides.push_back({attribute(node, "PartName").value_or(""), content_type});
        }
        return true;
    });
    return types;
}

bool is_vba_part(const archive::ZipEntry& entry) {
    std::string_view name = entry.name;
    auto slash = name.find_last_of('/');
    if (slash != std::string_view::npos)
        name.remove_prefix(slash + 1);
    return iequals(name, VBA_PROJECT_PART);
}

// Part names in [Content_Types].xml are absolute and compare case-insensitively.
bool has_part(const std::vector<archive::ZipEntry>& entries, std::string_view part_name) {
    if (part_name.starts_with('/'))
        part_name.remove_prefix(1);
    return std::ranges::any_of(
        entries, [&](const archive::ZipEntry& e) { return iequals(e.name, part_name); });
}

}  // namespace

std::string error_string(DocumentErrorKind kind) {
    switch (kind) {
        case DocumentErrorKind::NotSupported:
            return "Unsupported document format";
        case DocumentErrorKind::MissingPart:
            return "Required document part is missing";
        case DocumentErrorKind::MacrosNotAllowed:
            return "Macros are not allowed";
        case DocumentErrorKind::TemplateNotAllowed:
            return "Templates are not allowed";
        case DocumentErrorKind::AddInNotAllowed:
            return "Add-ins are not allowed";
        case DocumentErrorKind::BadMimetype:
            return "Invalid mimetype entry";
        case DocumentErrorKind::UnsafeManifestPath:
            return "Unsafe manifest path";
        case DocumentErrorKind::MalformedXml:
            return "Malformed XML part";
        case DocumentErrorKind::Archive:
            return "Archive could not be read";
        default:
            return "Unknown document error";
    }
}

std::expected<void, DocumentError> validate_open_xml(std::string_view extension,
                                                     const io::ByteSource& content) {
    auto host = host_for(extension);
    if (!host) {
        return fail(DocumentErrorKind::NotSupported,
                    std::format("'{}' is not an Open XML format", extension));
    }

    auto dir = archive::ZipDirectory::open(content);
    if (!dir) {
        return archive_failure(dir.error());
    }
    auto entries = dir->read_all();
    if (!entries) {
        return archive_failure(entries.error());
    }

    auto content_types_entry = std::ranges::find_if(
        *entries, [](const archive::ZipEntry& e) { return iequals(e.name, CONTENT_TYPES_PART); });
    if (content_types_entry == entries->end()) {
        return fail(DocumentErrorKind::MissingPart, std::format("Missing '{}'", CONTENT_TYPES_PART));
    }
    if (!has_part(*entries, RELATIONSHIPS_PART)) {
        return fail(DocumentErrorKind::MissingPart, std::format("Missing '{}'", RELATIONSHIPS_PART));
    }

    auto types = read_content_types(*dir, *content_types_entry);
    if (!types) {
        return std::unexpected(types.error());
    }

    if (types->declares_vba || std::ranges::any_of(*entries, is_vba_part)) {
        return fail(DocumentErrorKind::MacrosNotAllowed,
                    std::format("{} contains macros.", host->noun));
    }

    const Override* main_part = nullptr;
    for (const auto& item : types->overrides) {
        auto match = std::ranges::find_if(host->types, [&](const MainPartType& t) {
            return iequals(t.content_type, item.content_type);
        });
        if (match == host->types.end()) {
            continue;
        }

        switch (match->kind) {
            case PackageKind::MacroEnabled:
                return fail(DocumentErrorKind::MacrosNotAllowed,
                            std::format("{} contains macros.", host->noun));
            case PackageKind::AddIn:
                return fail(DocumentErrorKind::AddInNotAllowed, "Add-ins are not supported.");
            case PackageKind::Template:
                return fail(DocumentErrorKind::TemplateNotAllowed,
                            std::format("{} is a template.", host->noun));
            case PackageKind::Main:
                if (!main_part)
                    main_part = &item;
                break;
            default:
                break;
        }
    }

    if (!main_part) {
        return fail(DocumentErrorKind::MissingPart,
                    std::format("'{}' declares no main {} part", CONTENT_TYPES_PART,
                                to_lower(host->noun)));
    }
    if (!has_part(*entries, main_part->part_name)) {
        return fail(DocumentErrorKind::MissingPart,
                    std::format("Main part '{}' is not present in the package", main_part->part_name));
    }

    return {};
}

}  // namespace fileguard::document
