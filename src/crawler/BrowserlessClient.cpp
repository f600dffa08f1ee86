#include "../../include/scrape_core/crawler/BrowserlessClient.h"
#include "../../include/scrape_core/common/UrlUtils.h"
#include "../../include/Logger.h"
#include "FailureClassifier.h"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <mutex>

using json = nlohmann::json;

namespace scrape_core::crawler {

using namespace scrape_core::common;

namespace {

const std::string kPageScript = R"JS(module.exports = async ({ page, context }) => {
  const waitUntil = context.waitForNetworkIdle ? 'networkidle0' : 'load';
  if (context.userAgent) {
    await page.setUserAgent(context.userAgent);
  }
  if (context.headers && Object.keys(context.headers).length > 0) {
    await page.setExtraHTTPHeaders(context.headers);
  }
  if (context.proxyUsername) {
    await page.authenticate({ username: context.proxyUsername, password: context.proxyPassword });
  }
  if (context.cookies && context.cookies.length > 0) {
    await page.setCookie(...context.cookies.map((c) => (c.domain ? c : { ...c, url: context.url })));
  }

  let response = await page.goto(context.url, { waitUntil, timeout: context.timeout });

  if (context.form) {
    for (const field of context.form.fields) {
      await page.waitForSelector(field.locator, { timeout: context.timeout });
      await page.click(field.locator, { clickCount: 3 });
      await page.type(field.locator, field.value);
    }
    const navigation = page.waitForNavigation({ waitUntil, timeout: context.timeout }).catch(() => null);
    if (context.form.submit) {
      await page.click(context.form.submit);
    } else {
      await page.focus(context.form.pressEnterIn);
      await page.keyboard.press('Enter');
    }
    const submitted = await navigation;
    if (submitted) {
      response = submitted;
    }
  }

  return {
    type: 'application/json',
    data: {
      html: await page.content(),
      url: page.url(),
      status: response ? response.status() : 0,
      cookies: await page.cookies(),
    },
  };
};
)JS";

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    std::string* response = static_cast<std::string*>(userp);
    size_t totalSize = size * nmemb;
    response->append(static_cast<char*>(contents), totalSize);
    return totalSize;
}

int progressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* cancel = static_cast<const CancellationToken*>(clientp);
    return (cancel && cancel->isCancelled()) ? 1 : 0;
}

// Give Browserless time to report the page timeout itself
constexpr long kTransportGraceMs = 5000;

} // namespace

class BrowserlessClient::Impl {
public:
    Impl(const std::string& browserless_url, const std::string& token)
        : browserless_url_(browserless_url), token_(token) {
        while (!browserless_url_.empty() && browserless_url_.back() == '/') {
            browserless_url_.pop_back();
        }
    }

    BrowserlessRenderResult renderUrl(const BrowserlessRenderRequest& request, const CancellationToken& cancel) {
        BrowserlessRenderResult result;
        auto start_time = std::chrono::steady_clock::now();

        std::string user_agent;
        ProxySettings proxy;
        bool verify_ssl = true;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            user_agent = user_agent_;
            proxy = proxy_;
            verify_ssl = verify_ssl_;
        }

        const std::string endpoint = functionEndpoint(proxy, verify_ssl, request.timeout_ms);
        json payload = {
            {"code", kPageScript},
            {"context", buildContext(request, user_agent, proxy)}
        };
        const std::string json_payload = payload.dump();

        LOG_INFO("Starting headless browser rendering for: " + request.url);
        LOG_DEBUG("Browserless endpoint: " + browserless_url_ + "/function, payload size: " +
                  std::to_string(json_payload.size()) + " bytes");

        CURL* curl = curl_easy_init();
        if (!curl) {
            result.error = "Failed to create CURL handle";
            LOG_ERROR("Failed to create local CURL handle for BrowserlessClient");
            return result;
        }

        char errbuf[CURL_ERROR_SIZE] = {0};
        curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, json_payload.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(json_payload.size()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout_ms) + kTransportGraceMs);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 5000L);
        curl_easy_setopt(curl, CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
        curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");
        // No 100-continue round trip before the script body
        headers = curl_slist_append(headers, "Expect:");
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

        std::string response;
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);

        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &cancel);

        CURLcode res = curl_easy_perform(curl);
        curl_slist_free_all(headers);

        long http_code = 0;
        if (res == CURLE_OK) {
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
        }
        curl_easy_cleanup(curl);
        result.render_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        if (res != CURLE_OK) {
            result.failure = FailureClassifier::classifyCurlError(res, cancel.isCancelled());
            result.error = "CURL error: " + std::string(curl_easy_strerror(res)) + " | errbuf=" + errbuf;
            LOG_WARNING("Browserless request failed for: " + request.url + " - " + result.error +
                        " [duration_ms=" + std::to_string(result.render_time.count()) + "]");
            return result;
        }

        if (http_code != 200) {
            result.error = "Browserless returned HTTP " + std::to_string(http_code) + ": " + response;
            result.failure = http_code == 408 ? FetchStatus::TIMEOUT
                                              : FailureClassifier::classifyErrorMessage(response);
            LOG_ERROR("Browserless error: " + result.error);
            return result;
        }

        try {
            json data = json::parse(response);
            result.html = data.value("html", "");
            result.finalUrl = data.value("url", request.url);
            result.status_code = data.value("status", 0);
            if (data.contains("cookies") && data["cookies"].is_array()) {
                for (const auto& cookie : data["cookies"]) {
                    result.cookies.push_back(Cookie::fromJson(cookie));
                }
            }
            result.success = true;
        } catch (const json::exception& e) {
            result.error = "Malformed Browserless response: " + std::string(e.what());
            result.failure = FetchStatus::NETWORK_ERROR;
            LOG_ERROR(result.error);
            return result;
        }

        LOG_INFO("Successfully rendered page via browserless: " + request.url + ", size: " +
                 std::to_string(result.html.size()) + " bytes, render_time_ms=" +
                 std::to_string(result.render_time.count()));
        return result;
    }

    bool isAvailable() {
        CURL* curl = curl_easy_init();
        if (!curl) {
            return false;
        }

        std::string health_url = browserless_url_ + "/health";
        if (!token_.empty()) {
            health_url += "?token=" + urlEncode(token_);
        }

        curl_easy_setopt(curl, CURLOPT_URL, health_url.c_str());
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, 5000L);
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
        curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);

        CURLcode res = curl_easy_perform(curl);
        bool available = false;
        if (res == CURLE_OK) {
            long http_code = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
            available = (http_code == 200);
        } else {
            LOG_DEBUG("Browserless health check failed: " + std::string(curl_easy_strerror(res)));
        }

        curl_easy_cleanup(curl);
        return available;
    }

    void setUserAgent(const std::string& user_agent) {
        std::lock_guard<std::mutex> lock(mutex_);
        user_agent_ = user_agent;
    }

    void setProxy(const ProxySettings& proxy) {
        std::lock_guard<std::mutex> lock(mutex_);
        proxy_ = proxy;
    }

    void setVerifySSL(bool verify) {
        std::lock_guard<std::mutex> lock(mutex_);
        verify_ssl_ = verify;
    }

private:
    std::string functionEndpoint(const ProxySettings& proxy, bool verify_ssl, int timeout_ms) const {
        QueryParams query;
        if (!token_.empty()) {
            query.emplace_back("token", token_);
        }
        query.emplace_back("timeout", std::to_string(timeout_ms + kTransportGraceMs));
        // Chrome launch flags are passed as query parameters
        if (proxy.enabled && !proxy.server.empty()) {
            query.emplace_back("--proxy-server", proxy.server);
        }
        if (!verify_ssl) {
            query.emplace_back("--ignore-certificate-errors", "true");
        }
        return appendQuery(browserless_url_ + "/function", query);
    }

    static json buildContext(const BrowserlessRenderRequest& request,
                             const std::string& user_agent,
                             const ProxySettings& proxy) {
        json context = {
            {"url", request.url},
            {"timeout", request.timeout_ms},
            {"waitForNetworkIdle", request.wait_for_network_idle},
            {"userAgent", user_agent},
            {"headers", request.headers},
            {"cookies", json::array()}
        };
        for (const auto& cookie : request.cookies) {
            context["cookies"].push_back(cookie.toJson());
        }
        if (proxy.enabled && !proxy.username.empty()) {
            context["proxyUsername"] = proxy.username;
            context["proxyPassword"] = proxy.password;
        }
        if (request.form) {
            json fields = json::array();
            for (const auto& field : request.form->fields) {
                fields.push_back({{"locator", field.locator}, {"value", field.value}});
            }
            context["form"] = {
                {"fields", fields},
                {"submit", request.form->submitLocator},
                {"pressEnterIn", request.form->pressEnterIn}
            };
        }
        return context;
    }

    std::string browserless_url_;
    std::string token_;

    std::mutex mutex_;
    std::string user_agent_;
    ProxySettings proxy_;
    bool verify_ssl_ = true;
};

BrowserlessClient::BrowserlessClient(const std::string& browserless_url, const std::string& token)
    : pImpl(std::make_unique<Impl>(browserless_url, token)) {}

BrowserlessClient::~BrowserlessClient() = default;

BrowserlessRenderResult BrowserlessClient::renderUrl(const BrowserlessRenderRequest& request,
                                                     const CancellationToken& cancel) {
    return pImpl->renderUrl(request, cancel);
}

bool BrowserlessClient::isAvailable() {
    return pImpl->isAvailable();
}

void BrowserlessClient::setUserAgent(const std::string& user_agent) {
    pImpl->setUserAgent(user_agent);
}

void BrowserlessClient::setProxy(const ProxySettings& proxy) {
    pImpl->setProxy(proxy);
}

void BrowserlessClient::setVerifySSL(bool verify) {
    pImpl->setVerifySSL(verify);
}

const std::string& BrowserlessClient::pageScript() {
    return kPageScript;
}

} // namespace scrape_core::crawler
