#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "models/FetchConfig.h"

namespace scrape_core::crawler {

struct Cookie {
    std::string name;
    std::string value;
    std::string domain;
    std::string path = "/";
    bool secure = false;
    bool httpOnly = false;
    // Seconds since epoch, 0 for session cookies
    int64_t expires = 0;

    bool sameIdentity(const Cookie& other) const {
        return name == other.name && domain == other.domain && path == other.path;
    }

    // Netscape cookie-file line as produced and consumed by libcurl
    std::string toNetscapeLine() const;
    static std::optional<Cookie> fromNetscapeLine(const std::string& line);

    // Chrome DevTools cookie object as used by puppeteer
    nlohmann::json toJson() const;
    static Cookie fromJson(const nlohmann::json& j);
};

class CookieJar {
public:
    // Insert or replace by (name, domain, path). Returns true if the jar changed.
    bool set(const Cookie& cookie);

    // Merge a batch; returns the cookies that were new or changed value
    std::vector<Cookie> merge(const std::vector<Cookie>& cookies);

    std::optional<Cookie> find(const std::string& name) const;
    const std::vector<Cookie>& all() const { return cookies_; }
    size_t size() const { return cookies_.size(); }
    bool empty() const { return cookies_.empty(); }
    void clear() { cookies_.clear(); }

private:
    std::vector<Cookie> cookies_;
};

/**
 * Transport-specific authenticated state: the cookie jar for the HTTP
 * transport, the cookie jar plus an isolated context id for the browser
 * transport. Engines hand out value snapshots; the live copy stays inside
 * the engine that established it.
 */
struct SessionHandle {
    TransportKind transport = TransportKind::HTTP;
    CookieJar cookies;
    std::string contextId;

    bool empty() const { return cookies.empty() && contextId.empty(); }
};

} // namespace scrape_core::crawler
