/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

#include "include/document_validators.hpp"
#include "include/xml_document.hpp"
#include "tests/zip_builder.hpp"

using namespace fileguard;
using document::DocumentErrorKind;
using test::ZipBuilder;

namespace {

constexpr const char* RELS =
    R"(<?xml version="1.0" encoding="UTF-8"?>)"
    R"(<Relationships xmlns="http://schemas.openxmlformats.org/package/2006/relationships">)"
    R"(<Relationship Id="rId1" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument" Target="word/document.xml"/>)"
    R"(</Relationships>)";

std::string content_types(std::string_view part_name, std::string_view content_type,
                          std::string_view extra = {}) {
    return std::string(R"(<?xml version="1.0" encoding="UTF-8"?>)"
                       R"(<Types xmlns="http://schemas.openxmlformats.org/package/2006/content-types">)"
                       R"(<Default Extension="rels" ContentType="application/vnd.openxmlformats-package.relationships+xml"/>)"
                       R"(<Default Extension="xml" ContentType="application/xml"/>)"
                       R"(<Override PartName=")") +
           std::string(part_name) + R"(" ContentType=")" + std::string(content_type) + R"("/>)" +
           std::string(extra) + "</Types>";
}

constexpr const char* DOCX_MAIN =
    "application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml";
constexpr const char* XLSX_MAIN =
    "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet.main+xml";
constexpr const char* PPTX_SLIDESHOW =
    "application/vnd.openxmlformats-officedocument.presentationml.slideshow.main+xml";

ZipBuilder docx_with(std::string types) {
    ZipBuilder zip;
    zip.add("[Content_Types].xml", std::move(types), true)
        .add("_rels/.rels", RELS, true)
        .add("word/document.xml", "<w:document xmlns:w=\"urn:w\"/>", true);
    return zip;
}

constexpr const char* ODT_MIME = "application/vnd.oasis.opendocument.text";

std::string manifest(std::string_view path) {
    return std::string(
               R"(<?xml version="1.0" encoding="UTF-8"?>)"
               R"(<manifest:manifest xmlns:manifest="urn:oasis:names:tc:opendocument:xmlns:manifest:1.0" manifest:version="1.2">)"
               R"(<manifest:file-entry manifest:full-path="/" manifest:media-type="application/vnd.oasis.opendocument.text"/>)"
               R"(<manifest:file-entry manifest:full-path=")") +
           std::string(path) + R"(" manifest:media-type="text/xml"/></manifest:manifest>)";
}

ZipBuilder odt_with(std::string mimetype, std::string manifest_xml) {
    ZipBuilder zip;
    zip.add("mimetype", std::move(mimetype))
        .add("content.xml", "<office:document-content xmlns:office=\"urn:o\"/>", true)
        .add("META-INF/manifest.xml", std::move(manifest_xml), true);
    return zip;
}

}  // namespace

TEST(OpenXml, AcceptsMinimalDocument) {
    auto source = docx_with(content_types("/word/document.xml", DOCX_MAIN)).source();
    auto r = document::validate_open_xml(".docx", source);
    EXPECT_TRUE(r) << r.error().message;
}

TEST(OpenXml, MainPartLookupIgnoresCase) {
    auto source = docx_with(content_types("/Word/Document.XML", DOCX_MAIN)).source();
    EXPECT_TRUE(document::validate_open_xml(".docx", source));
}

TEST(OpenXml, RequiresContentTypesAndRelationships) {
    auto no_types = ZipBuilder().add("_rels/.rels", RELS).add("word/document.xml", "<a/>").source();
    auto r = document::validate_open_xml(".docx", no_types);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, DocumentErrorKind::MissingPart);

    auto no_rels = ZipBuilder()
                       .add("[Content_Types].xml", content_types("/word/document.xml", DOCX_MAIN))
                       .add("word/document.xml", "<a/>")
                       .source();
    r = document::validate_open_xml(".docx", no_rels);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, DocumentErrorKind::MissingPart);
    EXPECT_NE(r.error().message.find("_rels/.rels"), std::string::npos);
}

TEST(OpenXml, DeclaredMainPartMustExist) {
    auto source = ZipBuilder()
                      .add("[Content_Types].xml", content_types("/word/document.xml", DOCX_MAIN))
                      .add("_rels/.rels", RELS)
                      .source();
    auto r = document::validate_open_xml(".docx", source);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, DocumentErrorKind::MissingPart);
}

TEST(OpenXml, WrongHostMainPartIsMissing) {
    auto source = docx_with(content_types("/word/document.xml", DOCX_MAIN)).source();
    auto r = document::validate_open_xml(".xlsx", source);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, DocumentErrorKind::MissingPart);
}

TEST(OpenXml, RejectsMacroEnabledDocument) {
    auto source = docx_with(content_types("/word/document.xml",
                                          "application/vnd.ms-word.document.macroEnabled.main+xml"))
                      .source();
    auto r = document::validate_open_xml(".docx", source);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, DocumentErrorKind::MacrosNotAllowed);
    EXPECT_EQ(r.error().message, "Document contains macros.");
}

TEST(OpenXml, RejectsVbaProjectPart) {
    auto source = docx_with(content_types("/word/document.xml", DOCX_MAIN))
                      .add("word/vbaProject.bin", "\x01\x02\x03")
                      .source();
    auto r = document::validate_open_xml(".docx", source);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, DocumentErrorKind::MacrosNotAllowed);
}

TEST(OpenXml, PartHiddenBehindUnderstatedEntryCountIsRejected) {
    auto source = docx_with(content_types("/word/document.xml", DOCX_MAIN))
                      .add("word/vbaProject.bin", "\x01\x02\x03")
                      .declare_entry_count(3)
                      .source();
    auto r = document::validate_open_xml(".docx", source);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, DocumentErrorKind::Archive);
}

TEST(OpenXml, RejectsVbaContentTypeDeclaration) {
    auto types = content_types(
        "/word/document.xml",
        DOCX_MAIN,
        R"(<Default Extension="bin" ContentType="application/vnd.ms-office.vbaProject"/>)");
    auto r = document::validate_open_xml(".docx", docx_with(types).source());
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, DocumentErrorKind::MacrosNotAllowed);
}

TEST(OpenXml, RejectsTemplatesAndAddIns) {
    auto tmpl = ZipBuilder()
                    .add("[Content_Types].xml",
                         content_types("/xl/workbook.xml",
                                       "application/vnd.openxmlformats-officedocument.spreadsheetml.template.main+xml"))
                    .add("_rels/.rels", RELS)
                    .add("xl/workbook.xml", "<workbook/>")
                    .source();
    auto r = document::validate_open_xml(".xlsx", tmpl);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, DocumentErrorKind::TemplateNotAllowed);
    EXPECT_EQ(r.error().message, "Spreadsheet is a template.");

    auto addin = ZipBuilder()
                     .add("[Content_Types].xml",
                          content_types("/xl/workbook.xml", "application/vnd.ms-excel.addin.macroEnabled.main+xml"))
                     .add("_rels/.rels", RELS)
                     .add("xl/workbook.xml", "<workbook/>")
                     .source();
    r = document::validate_open_xml(".xlsx", addin);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, DocumentErrorKind::AddInNotAllowed);
    EXPECT_EQ(r.error().message, "Add-ins are not supported.");
}

TEST(OpenXml, AcceptsWorkbookAndSlideshow) {
    auto xlsx = ZipBuilder()
                    .add("[Content_Types].xml", content_types("/xl/workbook.xml", XLSX_MAIN))
                    .add("_rels/.rels", RELS)
                    .add("xl/workbook.xml", "<workbook/>")
                    .source();
    EXPECT_TRUE(document::validate_open_xml(".xlsx", xlsx));

    auto ppsx = ZipBuilder()
                    .add("[Content_Types].xml", content_types("/ppt/presentation.xml", PPTX_SLIDESHOW))
                    .add("_rels/.rels", RELS)
                    .add("ppt/presentation.xml", "<p:presentation xmlns:p=\"urn:p\"/>")
                    .source();
    EXPECT_TRUE(document::validate_open_xml(".pptx", ppsx));
}

TEST(OpenXml, RejectsMalformedContentTypes) {
    auto source = docx_with("<Types><Override").source();
    auto r = document::validate_open_xml(".docx", source);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, DocumentErrorKind::MalformedXml);

    auto wrong_root = docx_with("<NotTypes/>").source();
    r = document::validate_open_xml(".docx", wrong_root);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, DocumentErrorKind::MalformedXml);
}

TEST(OpenXml, UnsupportedExtension) {
    auto source = docx_with(content_types("/word/document.xml", DOCX_MAIN)).source();
    auto r = document::validate_open_xml(".odt", source);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, DocumentErrorKind::NotSupported);
}

TEST(OpenDocument, AcceptsMinimalText) {
    auto source = odt_with(ODT_MIME, manifest("content.xml")).source();
    auto r = document::validate_open_document(".odt", source);
    EXPECT_TRUE(r) << r.error().message;
}

TEST(OpenDocument, MimetypeIsOptional) {
    auto source = ZipBuilder()
                      .add("content.xml", "<c/>")
                      .add("META-INF/manifest.xml", manifest("content.xml"))
                      .source();
    EXPECT_TRUE(document::validate_open_document(".odt", source));
}

TEST(OpenDocument, RequiresManifestAndContent) {
    auto no_manifest = ZipBuilder().add("mimetype", ODT_MIME).add("content.xml", "<c/>").source();
    auto r = document::validate_open_document(".odt", no_manifest);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, DocumentErrorKind::MissingPart);

    auto no_content = ZipBuilder()
                          .add("mimetype", ODT_MIME)
                          .add("META-INF/manifest.xml", manifest("styles.xml"))
                          .source();
    r = document::validate_open_document(".odt", no_content);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, DocumentErrorKind::MissingPart);
}

TEST(OpenDocument, MimetypeMustMatchExtension) {
    auto source = odt_with("application/vnd.oasis.opendocument.spreadsheet", manifest("content.xml")).source();
    auto r = document::validate_open_document(".odt", source);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, DocumentErrorKind::BadMimetype);

    EXPECT_TRUE(document::validate_open_document(
        ".ods", odt_with("application/vnd.oasis.opendocument.spreadsheet", manifest("content.xml")).source()));
}

TEST(OpenDocument, MimetypeMustBeFirstAndStored) {
    auto late = ZipBuilder()
                    .add("content.xml", "<c/>")
                    .add("mimetype", ODT_MIME)
                    .add("META-INF/manifest.xml", manifest("content.xml"))
                    .source();
    auto r = document::validate_open_document(".odt", late);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, DocumentErrorKind::BadMimetype);

    auto deflated = ZipBuilder()
                        .add("mimetype", std::string(ODT_MIME) + std::string(200, ' '), true)
                        .add("content.xml", "<c/>")
                        .add("META-INF/manifest.xml", manifest("content.xml"))
                        .source();
    r = document::validate_open_document(".odt", deflated);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, DocumentErrorKind::BadMimetype);
}

TEST(OpenDocument, RejectsUnsafeManifestPaths) {
    for (const char* path : {"../outside.xml", "Pictures/..\\..\\evil.png", "C:/evil.xml",
                             "http://example.com/x.xml"}) {
        auto source = odt_with(ODT_MIME, manifest(path)).source();
        auto r = document::validate_open_document(".odt", source);
        ASSERT_FALSE(r) << path;
        EXPECT_EQ(r.error().kind, DocumentErrorKind::UnsafeManifestPath) << path;
    }
}

TEST(OpenDocument, AcceptsInnerParentSegmentsAndRootPaths) {
    for (const char* path : {"Pictures/../content.xml", "/Pictures/image.png", "Thumbnails/thumbnail.png"}) {
        auto source = odt_with(ODT_MIME, manifest(path)).source();
        auto r = document::validate_open_document(".odt", source);
        EXPECT_TRUE(r) << path << ": " << r.error().message;
    }
}

TEST(OpenDocument, MimetypeEntryNameIsCaseInsensitive) {
    auto late = ZipBuilder()
                    .add("content.xml", "<c/>")
                    .add("MimeType", ODT_MIME)
                    .add("META-INF/manifest.xml", manifest("content.xml"))
                    .source();
    auto r = document::validate_open_document(".odt", late);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, DocumentErrorKind::BadMimetype);

    auto upper = ZipBuilder()
                     .add("MIMETYPE", "application/vnd.oasis.opendocument.spreadsheet")
                     .add("content.xml", "<c/>")
                     .add("META-INF/manifest.xml", manifest("content.xml"))
                     .source();
    r = document::validate_open_document(".odt", upper);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, DocumentErrorKind::BadMimetype);
}

TEST(OpenDocument, RejectsMalformedManifest) {
    auto source = odt_with(ODT_MIME, "<manifest:manifest").source();
    auto r = document::validate_open_document(".odt", source);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, DocumentErrorKind::MalformedXml);
}

TEST(XmlDocument, WalksElementsAndReadsAttributes) {
    auto doc = document::XmlDocument::parse(R"(<root a="1"><child b="2"><leaf/></child></root>)", "test.xml");
    ASSERT_TRUE(doc);
    EXPECT_EQ(document::local_name(*doc->root()), "root");
    EXPECT_EQ(document::attribute(*doc->root(), "a"), "1");
    EXPECT_EQ(document::attribute(*doc->root(), "missing"), std::nullopt);

    std::vector<std::string> names;
    doc->for_each_element([&](const xmlNode& node) {
        names.emplace_back(document::local_name(node));
        return true;
    });
    EXPECT_EQ(names, (std::vector<std::string>{"root", "child", "leaf"}));
}

TEST(XmlDocument, ReportsPartNameOnError) {
    auto doc = document::XmlDocument::parse("<unterminated>", "content.xml");
    ASSERT_FALSE(doc);
    EXPECT_NE(doc.error().find("content.xml"), std::string::npos);
}
