/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/malware_scanner.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <fstream>
#include <memory>
#include <vector>

#include <openssl/err.h>
#include <openssl/evp.h>

#include "include/utils.hpp"

namespace fileguard::scan {

namespace {

constexpr std::size_t SHA256_HEX_LENGTH = 64;

std::string openssl_error(std::string_view what) {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return std::format("{} failed", what);
    }
    std::array<char, 256> buf{};
    ERR_error_string_n(code, buf.data(), buf.size());
    return std::format("{} failed: {}", what, buf.data());
}

}  // namespace

std::string_view to_string(ScanVerdict verdict) noexcept {
    switch (verdict) {
        case ScanVerdict::Clean:
            return "clean";
        case ScanVerdict::Infected:
            return "infected";
        default:
            return "unknown";
    }
}

std::expected<std::string, std::string> sha256_hex(const io::ByteSource& content) {
    auto ctx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        return std::unexpected(openssl_error("EVP_MD_CTX_new"));
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return std::unexpected(openssl_error("EVP_DigestInit_ex"));
    }

    std::vector<std::byte> chunk(Config::STREAM_READ_CHUNK);
    std::uint64_t offset = 0;
    while (offset < content.size()) {
        auto n = content.read_at(offset, chunk);
        if (!n) {
            return std::unexpected(io::error_string(n.error()));
        }
        if (*n == 0) {
            break;
        }
        if (EVP_DigestUpdate(ctx.get(), chunk.data(), *n) != 1) {
            return std::unexpected(openssl_error("EVP_DigestUpdate"));
        }
        offset += *n;
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
        return std::unexpected(openssl_error("EVP_DigestFinal_ex"));
    }

    std::string hex;
    hex.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        hex += std::format("{:02x}", digest[i]);
    }
    return hex;
}

std::expected<void, std::string> HashDenyListScanner::add_digest(std::string_view hex) {
    hex = trim_sv(hex);
    if (hex.size() != SHA256_HEX_LENGTH ||
        !std::ranges::all_of(hex, [](unsigned char c) { return std::isxdigit(c) != 0; })) {
        return std::unexpected(std::format("'{}' is not a SHA-256 hex digest", hex));
    }
    digests_.insert(to_lower(hex));
    return {};
}

std::expected<HashDenyListScanner, std::string> HashDenyListScanner::parse(std::istream& in) {
    HashDenyListScanner scanner;
    std::string line;
    std::size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        auto text = trim_sv(line);
        if (text.empty() || text.starts_with('#')) {
            continue;
        }
        if (auto r = scanner.add_digest(text); !r) {
            return std::unexpected(std::format("line {}: {}", line_no, r.error()));
        }
    }

    if (in.bad()) {
        return std::unexpected("Failed to read deny list");
    }
    return scanner;
}

std::expected<HashDenyListScanner, std::string> HashDenyListScanner::load(
    const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(std::format("Cannot open deny list '{}'", path.string()));
    }

    auto scanner = parse(in);
    if (!scanner) {
        return std::unexpected(std::format("{}: {}", path.string(), scanner.error()));
    }
    return scanner;
}

std::expected<ScanVerdict, std::string> HashDenyListScanner::scan(
    const io::ByteSource& content, std::string_view /*file_name*/) const {
    auto digest = sha256_hex(content);
    if (!digest) {
        return std::unexpected(digest.error());
    }
    return digests_.contains(*digest) ? ScanVerdict::Infected : ScanVerdict::Clean;
}

}  // namespace fileguard::scan
