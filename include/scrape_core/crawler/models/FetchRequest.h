#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "FetchConfig.h"
#include "../../common/UrlUtils.h"

namespace scrape_core::crawler {

struct FetchRequest {
    // Absolute, or relative to FetchConfig::baseUrl
    std::string url;
    common::QueryParams params;

    // Informational: the engine's transport is fixed at construction
    std::optional<TransportKind> transportHint;

    // Falls back to FetchConfig::requestTimeout (30s by default)
    std::optional<std::chrono::milliseconds> timeout;

    // Added to the engine's default headers for this request only
    std::map<std::string, std::string> headers;

    FetchRequest() = default;
    FetchRequest(std::string u) : url(std::move(u)) {}
    FetchRequest(const char* u) : url(u) {}
};

struct FormField {
    // username, password, ... as named in the field map
    std::string logicalName;
    // #id, [name=x], input[name="x"], .class or a bare field name
    std::string locator;
    std::string value;
};

// Form submission routed through the same admission path as a fetch
struct LoginForm {
    // Page holding the form
    std::string pageUrl;
    // Where the lightweight transport posts the form; empty means pageUrl
    std::string actionUrl;
    // In submission order
    std::vector<FormField> fields;
    // form field name -> value, posted as-is (CSRF tokens and the like)
    std::vector<std::pair<std::string, std::string>> hiddenFields;
    // Element to click; empty submits by pressing Enter in passwordLocator
    std::string submitLocator;
    std::string passwordLocator;
    std::optional<std::chrono::milliseconds> timeout;
};

} // namespace scrape_core::crawler
