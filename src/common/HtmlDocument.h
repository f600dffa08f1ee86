#pragma once

#include <functional>
#include <optional>
#include <string>
#include <gumbo.h>

namespace scrape_core::common {

// Owns a Gumbo parse tree for one page
class HtmlDocument {
public:
    explicit HtmlDocument(const std::string& html);
    ~HtmlDocument();

    HtmlDocument(const HtmlDocument&) = delete;
    HtmlDocument& operator=(const HtmlDocument&) = delete;

    bool valid() const { return output_ != nullptr; }

    // First element, in document order, for which the predicate holds
    const GumboNode* findElement(const std::function<bool(const GumboNode*)>& predicate) const;

    static std::optional<std::string> attribute(const GumboNode* node, const char* name);
    static bool isElement(const GumboNode* node, GumboTag tag);

private:
    static const GumboNode* findIn(const GumboNode* node, const std::function<bool(const GumboNode*)>& predicate);

    GumboOutput* output_;
};

} // namespace scrape_core::common
