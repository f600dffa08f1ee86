#include "CsrfTokenExtractor.h"
#include "../common/HtmlDocument.h"
#include "../../include/Logger.h"

#include <algorithm>
#include <array>

namespace scrape_core::auth {

using common::HtmlDocument;

namespace {

constexpr const char* kDefaultFieldName = "csrf_token";

const std::array<const char*, 2> kMetaNames = {"csrf-token", "_csrf_token"};
const std::array<const char*, 5> kInputNames = {"csrf_token", "csrf", "_csrf_token", "_token", "authenticity_token"};

std::optional<std::string> metaContent(const HtmlDocument& document, const std::string& name) {
    const GumboNode* meta = document.findElement([&](const GumboNode* node) {
        return HtmlDocument::isElement(node, GUMBO_TAG_META) &&
               HtmlDocument::attribute(node, "name") == name &&
               HtmlDocument::attribute(node, "content").has_value();
    });
    return meta ? HtmlDocument::attribute(meta, "content") : std::nullopt;
}

} // namespace

std::optional<CsrfToken> extractCsrfToken(const std::string& html) {
    HtmlDocument document(html);
    if (!document.valid()) {
        return std::nullopt;
    }

    for (const char* name : kMetaNames) {
        auto content = metaContent(document, name);
        if (!content || content->empty()) {
            continue;
        }
        CsrfToken token{kDefaultFieldName, *content};
        // Rails-style pages name the parameter in a companion meta tag
        if (std::string(name) == "csrf-token") {
            if (auto param = metaContent(document, "csrf-param"); param && !param->empty()) {
                token.fieldName = *param;
            }
        }
        LOG_DEBUG("CSRF token found in meta tag '" + std::string(name) + "'");
        return token;
    }

    const GumboNode* input = document.findElement([](const GumboNode* node) {
        if (!HtmlDocument::isElement(node, GUMBO_TAG_INPUT) || !HtmlDocument::attribute(node, "value")) {
            return false;
        }
        auto name = HtmlDocument::attribute(node, "name");
        return name && std::find(kInputNames.begin(), kInputNames.end(), *name) != kInputNames.end();
    });
    if (input) {
        CsrfToken token{*HtmlDocument::attribute(input, "name"), *HtmlDocument::attribute(input, "value")};
        LOG_DEBUG("CSRF token found in input '" + token.fieldName + "'");
        return token;
    }

    const GumboNode* tagged = document.findElement([](const GumboNode* node) {
        return HtmlDocument::attribute(node, "data-csrf").has_value();
    });
    if (tagged) {
        LOG_DEBUG("CSRF token found in data-csrf attribute");
        return CsrfToken{kDefaultFieldName, *HtmlDocument::attribute(tagged, "data-csrf")};
    }

    return std::nullopt;
}

} // namespace scrape_core::auth
