/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

#include "include/file_validator.hpp"
#include "tests/zip_builder.hpp"

using namespace fileguard;
using core::ConfigBuilder;
using core::FileValidator;
using core::Stage;
using core::ValidationErrorKind;
using test::ZipBuilder;

namespace {

constexpr const char* DOCX_TYPES =
    R"(<?xml version="1.0" encoding="UTF-8"?>)"
    R"(<Types xmlns="http://schemas.openxmlformats.org/package/2006/content-types">)"
    R"(<Override PartName="/word/document.xml" )"
    R"(ContentType="application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml"/>)"
    R"(</Types>)";

constexpr const char* ODT_MANIFEST =
    R"(<manifest:manifest xmlns:manifest="urn:oasis:names:tc:opendocument:xmlns:manifest:1.0">)"
    R"(<manifest:file-entry manifest:full-path="/" manifest:media-type="application/vnd.oasis.opendocument.text"/>)"
    R"(<manifest:file-entry manifest:full-path="content.xml" manifest:media-type="text/xml"/>)"
    R"(</manifest:manifest>)";

ZipBuilder docx() {
    ZipBuilder zip;
    zip.add("[Content_Types].xml", DOCX_TYPES, true)
        .add("_rels/.rels", "<Relationships/>", true)
        .add("word/document.xml", "<document/>", true);
    return zip;
}

ZipBuilder odt() {
    ZipBuilder zip;
    zip.add("mimetype", "application/vnd.oasis.opendocument.text")
        .add("content.xml", "<document-content/>", true)
        .add("META-INF/manifest.xml", ODT_MANIFEST, true);
    return zip;
}

const std::string PDF = "%PDF-1.7\n1 0 obj\n<<>>\nendobj\n%%EOF\n";

core::FileValidatorConfig lenient(std::initializer_list<std::string_view> types) {
    return ConfigBuilder().allow_file_types(types).throw_on_invalid_files(false).build();
}

// Records the stages a validation passes through.
struct StageLog {
    std::vector<Stage> stages;

    FileValidator::StageObserver observer() {
        return [this](Stage stage, const std::expected<void, core::ValidationError>&) {
            stages.push_back(stage);
        };
    }
};

}  // namespace

TEST(FileValidator, InvalidConfigThrowsAtConstruction) {
    core::FileValidatorConfig cfg;
    EXPECT_THROW(FileValidator{cfg}, core::ConfigurationError);

    cfg.supported_file_types = {".docx"};
    cfg.preflight.max_entries = core::Limit<std::int64_t>::of(0);
    EXPECT_THROW(FileValidator{cfg}, core::ConfigurationError);
}

TEST(FileValidator, AcceptsValidPdf) {
    FileValidator validator(lenient({".pdf"}));
    auto source = test::bytes_of(PDF);
    EXPECT_TRUE(validator.validate("report.pdf", source));
    EXPECT_TRUE(validator.is_valid_file("REPORT.PDF", source));
}

TEST(FileValidator, RejectsDisallowedAndMissingExtensions) {
    FileValidator validator(lenient({".pdf"}));
    auto source = test::bytes_of(PDF);

    auto r = validator.validate("report.docx", source);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ValidationErrorKind::UnsupportedFileType);
    EXPECT_EQ(r.error().message, "File type '.docx' is not allowed");

    r = validator.validate("report", source);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().message, "File has no extension");
}

TEST(FileValidator, RejectsEmptyAndOversizedFiles) {
    auto cfg = ConfigBuilder().allow_file_types({".pdf"}).set_file_size_limit(16).throw_on_invalid_files(false).build();
    FileValidator validator(cfg);

    auto empty = test::bytes_of("");
    auto r = validator.validate("a.pdf", empty);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ValidationErrorKind::EmptyFile);

    auto big = test::bytes_of(PDF);
    r = validator.validate("a.pdf", big);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ValidationErrorKind::FileTooLarge);
}

TEST(FileValidator, RejectsSpoofedSignature) {
    FileValidator validator(lenient({".png", ".pdf"}));
    auto source = test::bytes_of(PDF);
    auto r = validator.validate("image.png", source);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ValidationErrorKind::InvalidSignature);
}

TEST(FileValidator, AcceptsWellFormedOfficeDocuments) {
    FileValidator validator(lenient({".docx", ".odt"}));

    auto word = docx().source();
    auto r = validator.validate("letter.docx", word);
    EXPECT_TRUE(r) << r.error().message;

    auto writer = odt().source();
    r = validator.validate("letter.odt", writer);
    EXPECT_TRUE(r) << r.error().message;
}

TEST(FileValidator, PreflightRunsBeforeStructure) {
    FileValidator validator(lenient({".docx"}));
    auto hostile = docx().add("../../escape.txt", "x").source();

    StageLog log;
    validator.set_stage_observer(log.observer());
    auto r = validator.validate("letter.docx", hostile);

    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ValidationErrorKind::PreflightFailed);
    ASSERT_TRUE(r.error().preflight.has_value());
    EXPECT_EQ(r.error().preflight->violation, core::PreflightViolation::SuspiciousPath);
    EXPECT_EQ(log.stages,
              (std::vector<Stage>{Stage::FileType, Stage::Size, Stage::Signature, Stage::Preflight}));
}

TEST(FileValidator, DisabledPreflightFallsThroughToStructure) {
    auto cfg = ConfigBuilder()
                   .allow_file_types({".docx"})
                   .set_preflight(core::PreflightConfig::disabled())
                   .throw_on_invalid_files(false)
                   .build();
    FileValidator validator(cfg);

    auto hostile = docx().add("../../escape.txt", "x").source();
    EXPECT_TRUE(validator.validate("letter.docx", hostile));
}

TEST(FileValidator, StructureFailureIsReported) {
    FileValidator validator(lenient({".docx"}));
    auto no_main = ZipBuilder()
                       .add("[Content_Types].xml", DOCX_TYPES)
                       .add("_rels/.rels", "<Relationships/>")
                       .source();
    auto r = validator.validate("letter.docx", no_main);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ValidationErrorKind::InvalidOpenXml);

    FileValidator odf(lenient({".ods"}));
    auto wrong_mime = odt().source();
    r = odf.validate("sheet.ods", wrong_mime);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ValidationErrorKind::InvalidOpenDocument);
}

TEST(FileValidator, MalwareScanRunsLast) {
    scan::HashDenyListScanner deny;
    auto digest = scan::sha256_hex(test::bytes_of(PDF));
    ASSERT_TRUE(digest);
    ASSERT_TRUE(deny.add_digest(*digest));

    auto cfg = ConfigBuilder()
                   .allow_file_types({".pdf"})
                   .throw_on_invalid_files(false)
                   .add_malware_scanner(std::make_shared<scan::HashDenyListScanner>(std::move(deny)))
                   .build();
    FileValidator validator(cfg);

    StageLog log;
    validator.set_stage_observer(log.observer());
    auto infected = test::bytes_of(PDF);
    auto r = validator.validate("bad.pdf", infected);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ValidationErrorKind::MalwareDetected);
    EXPECT_EQ(log.stages.back(), Stage::MalwareScan);

    auto clean = test::bytes_of(PDF + "\n");
    EXPECT_TRUE(validator.validate("good.pdf", clean));
}

TEST(FileValidator, ScannerFailureIsNotMalware) {
    auto cfg = ConfigBuilder()
                   .allow_file_types({".pdf"})
                   .throw_on_invalid_files(false)
                   .add_malware_scanner(std::make_shared<scan::ClamScanScanner>("fileguard-no-such-scanner"))
                   .build();
    FileValidator validator(cfg);

    auto source = test::bytes_of(PDF);
    auto r = validator.validate("doc.pdf", source);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ValidationErrorKind::ScannerFailed);
}

TEST(FileValidator, MalwareCheckWithoutScannerFails) {
    FileValidator validator(lenient({".pdf"}));
    auto source = test::bytes_of(PDF);
    EXPECT_FALSE(validator.is_malware_clean("doc.pdf", source));
}

TEST(FileValidator, StageChecksThrowWhenConfigured) {
    FileValidator validator(ConfigBuilder().allow_file_types({".pdf", ".docx"}).build());
    auto pdf = test::bytes_of(PDF);

    EXPECT_TRUE(validator.is_valid_file_type("a.pdf"));
    EXPECT_TRUE(validator.has_valid_size(pdf));
    EXPECT_TRUE(validator.has_valid_signature("a.pdf", pdf));

    try {
        (void)validator.is_valid_file_type("a.exe");
        FAIL() << "expected FileValidationException";
    } catch (const core::FileValidationException& e) {
        EXPECT_EQ(e.error().kind, ValidationErrorKind::UnsupportedFileType);
    }

    EXPECT_THROW((void)validator.passes_preflight(test::bytes_of("not a zip")),
                 core::FileValidationException);
}

TEST(FileValidator, StageChecksReturnFalseWhenLenient) {
    FileValidator validator(lenient({".docx", ".odt"}));
    auto garbage = test::bytes_of("not a zip");

    EXPECT_FALSE(validator.is_valid_file_type("a.exe"));
    EXPECT_FALSE(validator.passes_preflight(garbage));
    EXPECT_FALSE(validator.is_valid_open_xml_document("a.docx", garbage));
    EXPECT_FALSE(validator.is_valid_open_document("a.odt", garbage));

    auto word = docx().source();
    EXPECT_TRUE(validator.passes_preflight(word));
    EXPECT_TRUE(validator.is_valid_open_xml_document("a.docx", word));
}

TEST(FileValidator, ValidatesFilesOnDisk) {
    FileValidator validator(lenient({".pdf"}));
    auto path = std::filesystem::temp_directory_path() /
                ("fileguard-validator-" + std::to_string(::getpid()) + ".pdf");
    {
        std::ofstream out(path, std::ios::binary);
        out << PDF;
    }

    EXPECT_TRUE(validator.validate(path));
    EXPECT_TRUE(validator.is_valid_file(path));
    std::filesystem::remove(path);

    auto r = validator.validate(path);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ValidationErrorKind::Unreadable);
}

TEST(FileValidator, SharedAcrossThreads) {
    const FileValidator validator(lenient({".docx"}));
    const auto good = docx().build();
    const auto bad = docx().add("/etc/passwd", "x").build();

    std::atomic<int> accepted{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> workers;
    for (int i = 0; i < 8; ++i) {
        workers.emplace_back([&, i] {
            io::MemoryByteSource source(std::span<const std::byte>(i % 2 == 0 ? good : bad));
            if (validator.validate("doc.docx", source)) {
                ++accepted;
            } else {
                ++rejected;
            }
        });
    }
    for (auto& t : workers) {
        t.join();
    }

    EXPECT_EQ(accepted.load(), 4);
    EXPECT_EQ(rejected.load(), 4);
}
