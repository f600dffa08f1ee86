#include "../../include/scrape_core/common/UrlUtils.h"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <sstream>
#include <string_view>

namespace scrape_core::common {

namespace {

constexpr const char* kAsciiSpace = " \t\r\n";

// UTF-8 of zero-width characters, BOM and bidi controls that ride along in pasted URLs
constexpr std::string_view kInvisibleMarks[] = {
    "\xE2\x80\x8B", "\xE2\x80\x8C", "\xE2\x80\x8D", "\xE2\x80\x8E", "\xE2\x80\x8F",
    "\xE2\x80\xAA", "\xE2\x80\xAB", "\xE2\x80\xAC", "\xE2\x80\xAD", "\xE2\x80\xAE",
    "\xE2\x81\xA0", "\xE2\x81\xA6", "\xE2\x81\xA7", "\xE2\x81\xA8", "\xE2\x81\xA9",
    "\xEF\xBB\xBF",
};

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

int defaultPort(const std::string& scheme) {
    if (scheme == "http") return 80;
    if (scheme == "https") return 443;
    return 0;
}

// RFC 3986 section 5.2.4
std::string removeDotSegments(const std::string& path) {
    std::vector<std::string> segments;
    std::string segment;
    std::istringstream stream(path);
    bool trailingSlash = !path.empty() && path.back() == '/';

    while (std::getline(stream, segment, '/')) {
        if (segment.empty() || segment == ".") {
            continue;
        }
        if (segment == "..") {
            if (!segments.empty()) segments.pop_back();
            continue;
        }
        segments.push_back(segment);
    }
    if (!path.empty()) {
        std::string last = path.substr(path.find_last_of('/') + 1);
        if (last == "." || last == "..") trailingSlash = true;
    }

    std::string out;
    for (const auto& s : segments) {
        out += "/" + s;
    }
    if (out.empty() || trailingSlash) {
        out += "/";
    }
    return out;
}

} // namespace

std::string ParsedUrl::authority() const {
    std::string out = scheme + "://" + host;
    if (port != 0 && port != defaultPort(scheme)) {
        out += ":" + std::to_string(port);
    }
    return out;
}

std::string sanitizeUrl(const std::string& input) {
    const auto first = input.find_first_not_of(kAsciiSpace);
    if (first == std::string::npos) {
        return "";
    }
    const auto last = input.find_last_not_of(kAsciiSpace);

    std::string out;
    out.reserve(last - first + 1);
    size_t i = first;
    while (i <= last) {
        unsigned char c = static_cast<unsigned char>(input[i]);
        if (c < 0x20 || c == 0x7F) {
            ++i;
            continue;
        }
        auto mark = std::find_if(std::begin(kInvisibleMarks), std::end(kInvisibleMarks),
                                 [&](std::string_view m) { return input.compare(i, m.size(), m) == 0; });
        if (mark != std::end(kInvisibleMarks)) {
            i += mark->size();
            continue;
        }
        out.push_back(input[i++]);
    }
    return out;
}

std::optional<ParsedUrl> parseUrl(const std::string& url) {
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        return std::nullopt;
    }

    ParsedUrl parsed;
    parsed.scheme = toLower(url.substr(0, schemeEnd));
    size_t rest = schemeEnd + 3;
    size_t authorityEnd = url.find_first_of("/?#", rest);
    std::string authority = url.substr(rest, authorityEnd == std::string::npos ? std::string::npos : authorityEnd - rest);

    // drop userinfo
    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }
    if (authority.empty()) {
        return std::nullopt;
    }

    size_t portSep = std::string::npos;
    if (authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) return std::nullopt;
        if (close + 1 < authority.size() && authority[close + 1] == ':') portSep = close + 1;
    } else {
        portSep = authority.rfind(':');
    }

    if (portSep != std::string::npos) {
        std::string portText = authority.substr(portSep + 1);
        if (!portText.empty()) {
            if (!std::all_of(portText.begin(), portText.end(), [](unsigned char c) { return std::isdigit(c); }) ||
                portText.size() > 5) {
                return std::nullopt;
            }
            parsed.port = std::stoi(portText);
            if (parsed.port > 65535) {
                return std::nullopt;
            }
        }
        authority = authority.substr(0, portSep);
    }
    parsed.host = toLower(authority);

    std::string tail = authorityEnd == std::string::npos ? "" : url.substr(authorityEnd);
    auto hash = tail.find('#');
    if (hash != std::string::npos) {
        parsed.fragment = tail.substr(hash + 1);
        tail = tail.substr(0, hash);
    }
    auto question = tail.find('?');
    if (question != std::string::npos) {
        parsed.query = tail.substr(question + 1);
        tail = tail.substr(0, question);
    }
    parsed.path = tail.empty() ? "/" : tail;
    return parsed;
}

bool isAbsoluteUrl(const std::string& url) {
    std::string prefix = toLower(url.substr(0, 8));
    return prefix.rfind("http://", 0) == 0 || prefix.rfind("https://", 0) == 0;
}

std::string targetOf(const std::string& url) {
    auto parsed = parseUrl(url);
    if (!parsed) {
        return url;
    }
    return parsed->authority();
}

std::string resolveUrl(const std::string& base, const std::string& reference) {
    if (isAbsoluteUrl(reference)) {
        return reference;
    }
    auto parsedBase = parseUrl(base);
    if (!parsedBase) {
        return reference;
    }
    if (reference.empty()) {
        return base;
    }
    if (reference.rfind("//", 0) == 0) {
        return parsedBase->scheme + ":" + reference;
    }

    const std::string authority = parsedBase->authority();
    if (reference.front() == '#') {
        std::string out = authority + parsedBase->path;
        if (!parsedBase->query.empty()) out += "?" + parsedBase->query;
        return out + reference;
    }
    if (reference.front() == '?') {
        return authority + parsedBase->path + reference;
    }

    std::string refPath = reference;
    std::string refSuffix;
    auto suffixStart = reference.find_first_of("?#");
    if (suffixStart != std::string::npos) {
        refPath = reference.substr(0, suffixStart);
        refSuffix = reference.substr(suffixStart);
    }

    std::string merged;
    if (refPath.front() == '/') {
        merged = refPath;
    } else {
        auto lastSlash = parsedBase->path.find_last_of('/');
        merged = parsedBase->path.substr(0, lastSlash + 1) + refPath;
    }
    return authority + removeDotSegments(merged) + refSuffix;
}

std::string urlEncode(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

std::string appendQuery(const std::string& url, const QueryParams& params) {
    if (params.empty()) {
        return url;
    }
    std::string base = url;
    std::string fragment;
    auto hash = base.find('#');
    if (hash != std::string::npos) {
        fragment = base.substr(hash);
        base = base.substr(0, hash);
    }

    std::string query;
    for (const auto& [key, value] : params) {
        if (!query.empty()) query += "&";
        query += urlEncode(key) + "=" + urlEncode(value);
    }

    char separator = '?';
    if (base.find('?') != std::string::npos) {
        separator = (base.back() == '?' || base.back() == '&') ? '\0' : '&';
    }
    if (separator != '\0') base.push_back(separator);
    return base + query + fragment;
}

std::string formEncode(const QueryParams& fields) {
    std::string body;
    for (const auto& [key, value] : fields) {
        if (!body.empty()) body += "&";
        body += urlEncode(key) + "=" + urlEncode(value);
    }
    return body;
}

} // namespace scrape_core::common
