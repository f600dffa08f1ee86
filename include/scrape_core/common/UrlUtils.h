#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace scrape_core::common {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

struct ParsedUrl {
    std::string scheme;   // lower-cased
    std::string host;     // lower-cased
    int port = 0;         // 0 when absent from the URL
    std::string path;     // "/" when absent
    std::string query;    // without leading '?'
    std::string fragment; // without leading '#'

    // scheme://host[:port] with default ports omitted
    std::string authority() const;
};

// Trim surrounding whitespace, drop control characters and invisible formatting marks
std::string sanitizeUrl(const std::string& input);

// nullopt for relative references and malformed authorities (bad or out-of-range port)
std::optional<ParsedUrl> parseUrl(const std::string& url);

// True for http:// and https:// URLs (case-insensitive)
bool isAbsoluteUrl(const std::string& url);

// Identity of the network authority a URL targets. Unparseable input is returned unchanged.
std::string targetOf(const std::string& url);

// Resolve a relative reference against an absolute base URL
std::string resolveUrl(const std::string& base, const std::string& reference);

// Append query parameters, percent-encoding keys and values
std::string appendQuery(const std::string& url, const QueryParams& params);

std::string urlEncode(const std::string& value);

// application/x-www-form-urlencoded body
std::string formEncode(const QueryParams& fields);

} // namespace scrape_core::common
