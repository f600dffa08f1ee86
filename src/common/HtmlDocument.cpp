#include "HtmlDocument.h"
#include "../../include/Logger.h"

namespace scrape_core::common {

HtmlDocument::HtmlDocument(const std::string& html)
    : output_(gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size())) {
    if (!output_) {
        LOG_ERROR("Failed to parse HTML with Gumbo (" + std::to_string(html.size()) + " bytes)");
    }
}

HtmlDocument::~HtmlDocument() {
    if (output_) {
        gumbo_destroy_output(&kGumboDefaultOptions, output_);
    }
}

const GumboNode* HtmlDocument::findElement(const std::function<bool(const GumboNode*)>& predicate) const {
    if (!output_) {
        return nullptr;
    }
    return findIn(output_->root, predicate);
}

const GumboNode* HtmlDocument::findIn(const GumboNode* node, const std::function<bool(const GumboNode*)>& predicate) {
    if (node->type != GUMBO_NODE_ELEMENT && node->type != GUMBO_NODE_TEMPLATE) {
        return nullptr;
    }
    if (predicate(node)) {
        return node;
    }
    for (unsigned int i = 0; i < node->v.element.children.length; ++i) {
        const auto* child = static_cast<const GumboNode*>(node->v.element.children.data[i]);
        if (const GumboNode* found = findIn(child, predicate)) {
            return found;
        }
    }
    return nullptr;
}

std::optional<std::string> HtmlDocument::attribute(const GumboNode* node, const char* name) {
    if (!node || node->type != GUMBO_NODE_ELEMENT) {
        return std::nullopt;
    }
    const GumboAttribute* attr = gumbo_get_attribute(&node->v.element.attributes, name);
    if (!attr) {
        return std::nullopt;
    }
    return std::string(attr->value);
}

bool HtmlDocument::isElement(const GumboNode* node, GumboTag tag) {
    return node && node->type == GUMBO_NODE_ELEMENT && node->v.element.tag == tag;
}

} // namespace scrape_core::common
