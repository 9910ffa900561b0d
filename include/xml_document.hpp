/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <libxml/parser.h>
#include <libxml/tree.h>

namespace fileguard::document {

// Read-only libxml2 tree over an untrusted package part. Parsing never touches
// the network, never loads external DTDs and never substitutes entities.
class XmlDocument {
    struct DocDeleter {
        void operator()(xmlDoc* doc) const {
            if (doc)
                xmlFreeDoc(doc);
        }
    };

    std::unique_ptr<xmlDoc, DocDeleter> doc_;

    explicit XmlDocument(xmlDoc* doc) : doc_(doc) {}

   public:
    static std::expected<XmlDocument, std::string> parse(std::string_view xml,
                                                         std::string_view part_name);

    [[nodiscard]] const xmlNode* root() const noexcept {
        return xmlDocGetRootElement(doc_.get());
    }

    // Visits every element in document order; stops early when `visit` returns false.
    void for_each_element(const std::function<bool(const xmlNode&)>& visit) const;
};

[[nodiscard]] std::string_view local_name(const xmlNode& node) noexcept;

// Attribute by local name, ignoring its namespace prefix.
[[nodiscard]] std::optional<std::string> attribute(const xmlNode& node, const char* name);

}  // namespace fileguard::document
