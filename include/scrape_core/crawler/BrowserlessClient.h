#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "SessionHandle.h"
#include "models/FetchConfig.h"
#include "models/FetchStatus.h"
#include "../common/CancellationToken.h"

namespace scrape_core::crawler {

struct BrowserFormField {
    std::string locator;
    std::string value;
};

// Fill-and-submit step run after navigation
struct BrowserFormAction {
    std::vector<BrowserFormField> fields;
    // Clicked when set; otherwise Enter is pressed in pressEnterIn
    std::string submitLocator;
    std::string pressEnterIn;
};

struct BrowserlessRenderRequest {
    std::string url;
    int timeout_ms = 30000;
    bool wait_for_network_idle = true;
    std::vector<Cookie> cookies;
    std::map<std::string, std::string> headers;
    std::optional<BrowserFormAction> form;
};

struct BrowserlessRenderResult {
    bool success = false;
    std::string html;
    std::string finalUrl;
    // Status of the page's main response, 0 if unknown
    int status_code = 0;
    std::vector<Cookie> cookies;
    std::string error;
    // TIMEOUT, CANCELLED or NETWORK_ERROR when success is false
    FetchStatus failure = FetchStatus::NETWORK_ERROR;
    std::chrono::milliseconds render_time{0};
};

/**
 * Client for a Browserless endpoint. Pages are driven by a puppeteer script
 * posted to /function; each call runs in a fresh page, with cookies passed in
 * and read back so the caller owns the session state.
 */
class BrowserlessClient {
public:
    BrowserlessClient(const std::string& browserless_url, const std::string& token = "");
    ~BrowserlessClient();

    /**
     * Navigate (and optionally fill and submit a form) in headless Chrome.
     * @param request Page, cookies and form step
     * @param cancel Aborts the call to Browserless when cancelled
     * @return Rendered document; success is false on transport failure
     */
    BrowserlessRenderResult renderUrl(const BrowserlessRenderRequest& request,
                                      const common::CancellationToken& cancel = common::CancellationToken());

    // HEAD /health with a short timeout
    bool isAvailable();

    void setUserAgent(const std::string& user_agent);
    void setProxy(const ProxySettings& proxy);
    void setVerifySSL(bool verify);

    // Script posted to /function
    static const std::string& pageScript();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace scrape_core::crawler
