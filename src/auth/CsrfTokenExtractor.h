#pragma once

#include <optional>
#include <string>

namespace scrape_core::auth {

struct CsrfToken {
    // Form field the token is posted under
    std::string fieldName;
    std::string value;
};

/**
 * Look for an anti-forgery token in a login page, in order: meta tags
 * (csrf-token, named by a csrf-param meta when present, then _csrf_token),
 * hidden inputs (csrf_token, csrf, _csrf_token, _token, authenticity_token),
 * then any data-csrf attribute.
 */
std::optional<CsrfToken> extractCsrfToken(const std::string& html);

} // namespace scrape_core::auth
