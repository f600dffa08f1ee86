#include "../../include/scrape_core/crawler/models/FetchConfig.h"
#include "../../include/scrape_core/common/Errors.h"
#include "../../include/scrape_core/common/UrlUtils.h"
#include "../../include/Logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

using json = nlohmann::json;
using scrape_core::common::ConfigurationError;

namespace scrape_core::crawler {

namespace {

std::chrono::milliseconds secondsField(const json& j, const char* key, std::chrono::milliseconds fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto& value = j.at(key);
    if (!value.is_number()) {
        throw ConfigurationError(std::string("'") + key + "' must be a number of seconds");
    }
    double seconds = value.get<double>();
    if (seconds < 0) {
        throw ConfigurationError(std::string("'") + key + "' must not be negative");
    }
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

template <typename T>
T typedField(const json& j, const char* key, T fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    try {
        return j.at(key).get<T>();
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

} // namespace

std::string transportKindToString(TransportKind kind) {
    switch (kind) {
        case TransportKind::HTTP: return "http";
        case TransportKind::BROWSER: return "browser";
    }
    return "unknown";
}

TransportKind transportKindFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "http" || lower == "lightweight") {
        return TransportKind::HTTP;
    }
    if (lower == "browser") {
        return TransportKind::BROWSER;
    }
    throw ConfigurationError("Unknown transport '" + name + "' (expected http or browser)");
}

RateLimitConfig RateLimitConfig::fromJson(const json& j) {
    if (!j.is_object()) {
        throw ConfigurationError("rate limit configuration must be a JSON object");
    }

    RateLimitConfig config;
    config.baseDelay = secondsField(j, "base_delay", config.baseDelay);
    config.jitter = secondsField(j, "jitter", config.jitter);
    config.maxBackoffDelay = secondsField(j, "max_backoff", config.maxBackoffDelay);
    config.coolDownDelay = secondsField(j, "cool_down", config.coolDownDelay);

    long long concurrency = typedField<long long>(j, "concurrency", static_cast<long long>(config.concurrency));
    if (concurrency < 1) {
        throw ConfigurationError("'concurrency' must be at least 1");
    }
    config.concurrency = static_cast<size_t>(concurrency);

    config.backoffThreshold = typedField<int>(j, "backoff_threshold", config.backoffThreshold);
    config.coolDownThreshold = typedField<int>(j, "cool_down_threshold", config.coolDownThreshold);
    if (config.backoffThreshold < 1 || config.coolDownThreshold < config.backoffThreshold) {
        throw ConfigurationError("backoff thresholds must satisfy 1 <= backoff_threshold <= cool_down_threshold");
    }
    config.maxTrackedTargets = typedField<size_t>(j, "max_tracked_targets", config.maxTrackedTargets);

    if (j.contains("per_target_overrides")) {
        const auto& overrides = j.at("per_target_overrides");
        if (!overrides.is_object()) {
            throw ConfigurationError("'per_target_overrides' must map authority to seconds");
        }
        for (const auto& [authority, value] : overrides.items()) {
            json single = {{"delay", value}};
            std::string target = common::isAbsoluteUrl(authority) ? common::targetOf(authority) : authority;
            config.perTargetOverrides[target] = secondsField(single, "delay", config.baseDelay);
        }
    }

    return config;
}

ProxySettings ProxySettings::fromJson(const json& j) {
    if (!j.is_object()) {
        throw ConfigurationError("proxy settings must be a JSON object");
    }
    ProxySettings proxy;
    proxy.enabled = typedField<bool>(j, "enabled", false);
    proxy.server = typedField<std::string>(j, "server", "");
    proxy.username = typedField<std::string>(j, "username", "");
    proxy.password = typedField<std::string>(j, "password", "");
    if (proxy.enabled && proxy.server.empty()) {
        throw ConfigurationError("proxy is enabled but 'server' is empty");
    }
    return proxy;
}

FetchConfig FetchConfig::fromJson(const json& j) {
    if (!j.is_object()) {
        throw ConfigurationError("fetch configuration must be a JSON object");
    }

    FetchConfig config;
    config.baseUrl = typedField<std::string>(j, "base_url", "");
    if (j.contains("transport")) {
        config.transport = transportKindFromString(typedField<std::string>(j, "transport", "http"));
    } else if (typedField<bool>(j, "use_browser", false)) {
        config.transport = TransportKind::BROWSER;
    }
    config.requestTimeout = secondsField(j, "timeout", config.requestTimeout);
    config.connectTimeout = secondsField(j, "connect_timeout", config.connectTimeout);
    config.followRedirects = typedField<bool>(j, "follow_redirects", config.followRedirects);
    config.maxRedirects = typedField<size_t>(j, "max_redirects", config.maxRedirects);
    config.verifySSL = typedField<bool>(j, "verify_ssl", config.verifySSL);
    config.userAgent = typedField<std::string>(j, "user_agent", config.userAgent);
    config.rotateUserAgent = typedField<bool>(j, "user_agent_rotation", config.rotateUserAgent);
    config.customHeaders = typedField<std::map<std::string, std::string>>(j, "headers", {});
    if (j.contains("proxy_settings")) {
        config.proxy = ProxySettings::fromJson(j.at("proxy_settings"));
    }
    config.browserlessUrl = typedField<std::string>(j, "browserless_url", config.browserlessUrl);
    config.browserlessToken = typedField<std::string>(j, "browserless_token", config.browserlessToken);

    config.validate();
    return config;
}

void FetchConfig::applyEnvironmentOverrides() {
    if (const char* envUrl = std::getenv("BROWSERLESS_URL")) {
        LOG_INFO("Using BROWSERLESS_URL from environment: " + std::string(envUrl));
        browserlessUrl = envUrl;
    }
    if (const char* envToken = std::getenv("BROWSERLESS_TOKEN")) {
        browserlessToken = envToken;
    }
    if (const char* envTimeout = std::getenv("SCRAPE_CORE_REQUEST_TIMEOUT_MS")) {
        try {
            long long ms = std::stoll(envTimeout);
            if (ms > 0) {
                requestTimeout = std::chrono::milliseconds(ms);
                LOG_INFO("Using SCRAPE_CORE_REQUEST_TIMEOUT_MS from environment: " + std::to_string(ms) + "ms");
            }
        } catch (const std::exception&) {
            LOG_WARNING("Invalid SCRAPE_CORE_REQUEST_TIMEOUT_MS, keeping " + std::to_string(requestTimeout.count()) + "ms");
        }
    }
}

void FetchConfig::validate() const {
    if (!baseUrl.empty() && !common::parseUrl(baseUrl)) {
        throw ConfigurationError("base_url is not an absolute URL: " + baseUrl);
    }
    if (requestTimeout.count() <= 0) {
        throw ConfigurationError("request timeout must be positive");
    }
    if (transport == TransportKind::BROWSER && browserlessUrl.empty()) {
        throw ConfigurationError("browser transport requires a browserless_url");
    }
    if (proxy.enabled && proxy.server.empty()) {
        throw ConfigurationError("proxy is enabled but no server is configured");
    }
}

} // namespace scrape_core::crawler
