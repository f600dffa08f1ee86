#pragma once

#include <chrono>
#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace scrape_core::crawler {

enum class TransportKind {
    HTTP,    // libcurl, one request/response per fetch
    BROWSER  // headless Chrome behind a Browserless endpoint
};

std::string transportKindToString(TransportKind kind);

// Accepts "http"/"lightweight" and "browser"; throws ConfigurationError otherwise
TransportKind transportKindFromString(const std::string& name);

struct RateLimitConfig {
    std::chrono::milliseconds baseDelay{1000};
    std::chrono::milliseconds jitter{500};
    size_t concurrency = 1;

    // authority (scheme://host[:port]) -> base delay
    std::map<std::string, std::chrono::milliseconds> perTargetOverrides;

    // Consecutive failures before exponential backoff kicks in
    int backoffThreshold = 3;
    // Consecutive failures before the target is put in cool-down
    int coolDownThreshold = 10;
    std::chrono::milliseconds maxBackoffDelay{300000};
    std::chrono::milliseconds coolDownDelay{3600000};

    // Idle targets beyond this count are evicted least-recently-used first
    size_t maxTrackedTargets = 10000;

    /**
     * Build from JSON. Durations are seconds (floating point allowed):
     * {"base_delay": 1.0, "jitter": 0.5, "concurrency": 4,
     *  "per_target_overrides": {"https://example.com": 2.0},
     *  "max_backoff": 300, "cool_down": 3600}
     * Throws ConfigurationError on malformed input.
     */
    static RateLimitConfig fromJson(const nlohmann::json& j);
};

struct ProxySettings {
    bool enabled = false;
    std::string server;
    std::string username;
    std::string password;

    static ProxySettings fromJson(const nlohmann::json& j);
};

struct FetchConfig {
    // Relative request URLs are resolved against this
    std::string baseUrl;
    TransportKind transport = TransportKind::HTTP;

    std::chrono::milliseconds requestTimeout{30000};
    std::chrono::milliseconds connectTimeout{10000};
    bool followRedirects = true;
    size_t maxRedirects = 5;
    bool verifySSL = true;

    std::string userAgent = "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/124.0.0.0 Safari/537.36";
    bool rotateUserAgent = false;
    std::map<std::string, std::string> customHeaders;
    ProxySettings proxy;

    // Browser transport
    std::string browserlessUrl = "http://browserless:3000";
    std::string browserlessToken;

    // Keys: base_url, transport, timeout (s), connect_timeout (s), follow_redirects,
    // max_redirects, verify_ssl, user_agent, user_agent_rotation, headers,
    // proxy_settings, browserless_url, browserless_token
    static FetchConfig fromJson(const nlohmann::json& j);

    // BROWSERLESS_URL, BROWSERLESS_TOKEN, SCRAPE_CORE_REQUEST_TIMEOUT_MS
    void applyEnvironmentOverrides();

    // Throws ConfigurationError when a required setting is missing or inconsistent
    void validate() const;
};

} // namespace scrape_core::crawler
