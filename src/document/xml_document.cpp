/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/xml_document.hpp"

#include <format>
#include <limits>
#include <mutex>
#include <vector>

namespace fileguard::document {

namespace {

struct XmlCharDeleter {
    void operator()(xmlChar* text) const {
        if (text)
            xmlFree(text);
    }
};
using UniqueXmlChar = std::unique_ptr<xmlChar, XmlCharDeleter>;

constexpr int PARSE_OPTIONS = XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING |
                              XML_PARSE_NOBLANKS | XML_PARSE_NOCDATA;

void ensure_parser_initialized() {
    static std::once_flag once;
    std::call_once(once, [] { xmlInitParser(); });
}

}  // namespace

std::expected<XmlDocument, std::string> XmlDocument::parse(std::string_view xml,
                                                           std::string_view part_name) {
    if (xml.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        return std::unexpected(std::format("'{}' is too large to parse", part_name));
    }

    ensure_parser_initialized();

    std::string url(part_name);
    xmlDoc* doc = xmlReadMemory(
        xml.data(), static_cast<int>(xml.size()), url.c_str(), nullptr, PARSE_OPTIONS);
    if (!doc) {
        const xmlError* err = xmlGetLastError();
        std::string detail = (err && err->message) ? std::string(err->message) : "parse error";
        while (!detail.empty() && (detail.back() == '\n' || detail.back() == ' ')) {
            detail.pop_back();
        }
        return std::unexpected(std::format("'{}' is not well-formed XML: {}", part_name, detail));
    }

    XmlDocument parsed(doc);
    if (!parsed.root()) {
        return std::unexpected(std::format("'{}' has no root element", part_name));
    }
    return parsed;
}

void XmlDocument::for_each_element(const std::function<bool(const xmlNode&)>& visit) const {
    // Iterative walk; package parts are attacker-controlled and may nest deeply.
    std::vector<const xmlNode*> pending{root()};
    while (!pending.empty()) {
        const xmlNode* node = pending.back();
        pending.pop_back();

        if (node->type == XML_ELEMENT_NODE && !visit(*node)) {
            return;
        }

        std::vector<const xmlNode*> children;
        for (const xmlNode* child = node->children; child; child = child->next) {
            if (child->type == XML_ELEMENT_NODE)
                children.push_back(child);
        }
        pending.insert(pending.end(), children.rbegin(), children.rend());
    }
}

std::string_view local_name(const xmlNode& node) noexcept {
    return node.name ? std::string_view(reinterpret_cast<const char*>(node.name)) : std::string_view{};
}

std::optional<std::string> attribute(const xmlNode& node, const char* name) {
    UniqueXmlChar value(
        xmlGetProp(const_cast<xmlNode*>(&node), reinterpret_cast<const xmlChar*>(name)));
    if (!value) {
        return std::nullopt;
    }
    return std::string(reinterpret_cast<const char*>(value.get()));
}

}  // namespace fileguard::document
