#include "../../include/scrape_core/crawler/SessionHandle.h"

#include <sstream>

using json = nlohmann::json;

namespace scrape_core::crawler {

namespace {

const std::string kHttpOnlyPrefix = "#HttpOnly_";

} // namespace

std::string Cookie::toNetscapeLine() const {
    std::string host = domain;
    bool includeSubdomains = !host.empty() && host.front() == '.';
    std::ostringstream line;
    if (httpOnly) {
        line << kHttpOnlyPrefix;
    }
    line << host << '\t'
         << (includeSubdomains ? "TRUE" : "FALSE") << '\t'
         << (path.empty() ? "/" : path) << '\t'
         << (secure ? "TRUE" : "FALSE") << '\t'
         << expires << '\t'
         << name << '\t'
         << value;
    return line.str();
}

std::optional<Cookie> Cookie::fromNetscapeLine(const std::string& line) {
    std::string text = line;
    Cookie cookie;
    if (text.rfind(kHttpOnlyPrefix, 0) == 0) {
        cookie.httpOnly = true;
        text = text.substr(kHttpOnlyPrefix.size());
    } else if (!text.empty() && text.front() == '#') {
        return std::nullopt;
    }

    std::vector<std::string> fields;
    std::string field;
    std::istringstream stream(text);
    while (std::getline(stream, field, '\t')) {
        fields.push_back(field);
    }
    // empty cookie values drop the trailing field
    if (fields.size() == 6) {
        fields.emplace_back();
    }
    if (fields.size() != 7) {
        return std::nullopt;
    }

    cookie.domain = fields[0];
    cookie.path = fields[2];
    cookie.secure = fields[3] == "TRUE";
    try {
        cookie.expires = std::stoll(fields[4]);
    } catch (const std::exception&) {
        cookie.expires = 0;
    }
    cookie.name = fields[5];
    cookie.value = fields[6];
    if (cookie.name.empty()) {
        return std::nullopt;
    }
    return cookie;
}

json Cookie::toJson() const {
    json j = {
        {"name", name},
        {"value", value},
        {"domain", domain},
        {"path", path},
        {"secure", secure},
        {"httpOnly", httpOnly}
    };
    if (expires > 0) {
        j["expires"] = expires;
    }
    return j;
}

Cookie Cookie::fromJson(const json& j) {
    Cookie cookie;
    cookie.name = j.value("name", "");
    cookie.value = j.value("value", "");
    cookie.domain = j.value("domain", "");
    cookie.path = j.value("path", "/");
    cookie.secure = j.value("secure", false);
    cookie.httpOnly = j.value("httpOnly", false);
    // DevTools reports -1 for session cookies
    double expires = j.value("expires", 0.0);
    cookie.expires = expires > 0 ? static_cast<int64_t>(expires) : 0;
    return cookie;
}

bool CookieJar::set(const Cookie& cookie) {
    for (auto& existing : cookies_) {
        if (existing.sameIdentity(cookie)) {
            if (existing.value == cookie.value && existing.expires == cookie.expires) {
                return false;
            }
            existing = cookie;
            return true;
        }
    }
    cookies_.push_back(cookie);
    return true;
}

std::vector<Cookie> CookieJar::merge(const std::vector<Cookie>& cookies) {
    std::vector<Cookie> changed;
    for (const auto& cookie : cookies) {
        if (set(cookie)) {
            changed.push_back(cookie);
        }
    }
    return changed;
}

std::optional<Cookie> CookieJar::find(const std::string& name) const {
    for (const auto& cookie : cookies_) {
        if (cookie.name == name) {
            return cookie;
        }
    }
    return std::nullopt;
}

} // namespace scrape_core::crawler
