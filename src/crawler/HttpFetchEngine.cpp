#include "HttpFetchEngine.h"
#include "FailureClassifier.h"
#include "../../include/scrape_core/common/Errors.h"
#include "../../include/scrape_core/common/UrlUtils.h"
#include "../../include/Logger.h"

#include <algorithm>

namespace scrape_core::crawler {

using namespace scrape_core::common;
using std::chrono::milliseconds;

namespace {

std::once_flag curlGlobalInit;

void ensureCurlGlobalInit() {
    std::call_once(curlGlobalInit, [] {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            LOG_ERROR("curl_global_init failed: " + std::string(curl_easy_strerror(rc)));
        }
    });
}

std::string stripQuotes(std::string value) {
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

} // namespace

HttpFetchEngine::HttpFetchEngine(const FetchConfig& config, std::shared_ptr<RateController> rateController)
    : FetchEngine(config, std::move(rateController)) {
    ensureCurlGlobalInit();
    LOG_DEBUG("HttpFetchEngine created, base URL: " + (config.baseUrl.empty() ? std::string("<none>") : config.baseUrl));
}

HttpFetchEngine::~HttpFetchEngine() {
    shutdown();
}

std::string HttpFetchEngine::formFieldName(const FormField& field) {
    const std::string& locator = field.locator;
    if (locator.empty()) {
        return field.logicalName;
    }

    auto nameAttr = locator.find("[name=");
    if (nameAttr != std::string::npos) {
        auto start = nameAttr + 6;
        auto end = locator.find(']', start);
        if (end != std::string::npos) {
            return stripQuotes(locator.substr(start, end - start));
        }
    }

    if (locator.front() == '#') {
        std::string id = locator.substr(1);
        if (!id.empty() && id.find_first_of(" .[:>#") == std::string::npos) {
            return id;
        }
        return field.logicalName;
    }

    if (locator.find_first_of(" .[:>#") == std::string::npos) {
        return locator;
    }
    return field.logicalName;
}

void HttpFetchEngine::openTransport(const SessionHandle& restored) {
    if (share_) {
        LOG_WARNING("CURL share handle still open, releasing it before reopening");
        closeTransport();
    }
    share_ = curl_share_init();
    if (!share_) {
        LOG_ERROR("Failed to initialize CURL share handle");
        throw NetworkError("Failed to initialize CURL share handle", config().baseUrl);
    }

    curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, lockShare);
    curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, unlockShare);
    curl_share_setopt(share_, CURLSHOPT_USERDATA, this);
    curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_COOKIE);
    curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
    curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
    CURLSHcode rc = curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
    if (rc != CURLSHE_OK) {
        LOG_WARNING("Connection sharing unavailable: " + std::string(curl_share_strerror(rc)));
    }

    if (!restored.cookies.empty()) {
        std::vector<std::string> lines;
        for (const auto& cookie : restored.cookies.all()) {
            lines.push_back(cookie.toNetscapeLine());
        }
        loadCookies(lines);
        LOG_DEBUG("Restored " + std::to_string(lines.size()) + " cookies into CURL share");
    }
}

void HttpFetchEngine::closeTransport() {
    if (!share_) {
        return;
    }
    CURLSHcode rc = curl_share_cleanup(share_);
    if (rc != CURLSHE_OK) {
        LOG_ERROR("CURL share cleanup failed: " + std::string(curl_share_strerror(rc)));
    }
    share_ = nullptr;
    LOG_DEBUG("CURL share handle released");
}

void HttpFetchEngine::onSessionAdopted(const SessionHandle& session) {
    std::vector<std::string> lines;
    for (const auto& cookie : session.cookies.all()) {
        lines.push_back(cookie.toNetscapeLine());
    }
    loadCookies(lines);
}

void HttpFetchEngine::onSessionInvalidated() {
    loadCookies({"ALL"});
}

void HttpFetchEngine::loadCookies(const std::vector<std::string>& lines) {
    if (!share_ || lines.empty()) {
        return;
    }
    CURL* handle = curl_easy_init();
    if (!handle) {
        LOG_ERROR("Failed to create CURL handle for cookie update");
        throw NetworkError("Failed to create CURL handle for cookie update", config().baseUrl);
    }
    curl_easy_setopt(handle, CURLOPT_SHARE, share_);
    curl_easy_setopt(handle, CURLOPT_COOKIEFILE, "");
    for (const auto& line : lines) {
        CURLcode rc = curl_easy_setopt(handle, CURLOPT_COOKIELIST, line.c_str());
        if (rc != CURLE_OK) {
            LOG_WARNING("Rejected cookie line: " + std::string(curl_easy_strerror(rc)));
        }
    }
    curl_easy_cleanup(handle);
}

std::vector<Cookie> HttpFetchEngine::readCookies(CURL* handle) {
    std::vector<Cookie> cookies;
    struct curl_slist* list = nullptr;
    if (curl_easy_getinfo(handle, CURLINFO_COOKIELIST, &list) != CURLE_OK) {
        LOG_WARNING("Unable to read cookies from CURL handle");
        return cookies;
    }
    for (struct curl_slist* item = list; item; item = item->next) {
        auto cookie = Cookie::fromNetscapeLine(item->data);
        if (cookie) {
            cookies.push_back(*cookie);
        }
    }
    curl_slist_free_all(list);
    return cookies;
}

FetchEngine::TransportResponse HttpFetchEngine::performFetch(const std::string& url,
                                                             const FetchRequest& request,
                                                             milliseconds timeout,
                                                             const CancellationToken& cancel) {
    return perform(url, nullptr, requestHeaders(request.headers), timeout, cancel);
}

FetchEngine::TransportResponse HttpFetchEngine::performSubmit(const LoginForm& form,
                                                              const std::string& pageUrl,
                                                              const std::string& actionUrl,
                                                              milliseconds timeout,
                                                              const CancellationToken& cancel) {
    QueryParams fields;
    for (const auto& field : form.fields) {
        fields.emplace_back(formFieldName(field), field.value);
    }
    for (const auto& hidden : form.hiddenFields) {
        fields.push_back(hidden);
    }
    const std::string body = formEncode(fields);

    auto headers = requestHeaders({});
    headers["Content-Type"] = "application/x-www-form-urlencoded";
    headers["Referer"] = pageUrl;

    LOG_DEBUG("Posting " + std::to_string(fields.size()) + " form fields to " + actionUrl);
    return perform(actionUrl, &body, headers, timeout, cancel);
}

FetchEngine::TransportResponse HttpFetchEngine::perform(const std::string& url,
                                                        const std::string* postBody,
                                                        const std::map<std::string, std::string>& headers,
                                                        milliseconds timeout,
                                                        const CancellationToken& cancel) {
    if (!share_) {
        throw CancelledError("HTTP transport is closed: " + url, url);
    }

    CURL* handle = curl_easy_init();
    if (!handle) {
        LOG_ERROR("Failed to create CURL handle for " + url);
        throw NetworkError("Failed to create CURL handle", url);
    }

    char errbuf[CURL_ERROR_SIZE] = {0};
    const FetchConfig& cfg = config();
    const std::string agent = userAgent();
    long timeoutMs = static_cast<long>(timeout.count());
    long connectMs = static_cast<long>(std::min(cfg.connectTimeout, timeout).count());

    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle, CURLOPT_PROTOCOLS, CURLPROTO_HTTP | CURLPROTO_HTTPS);
    curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(handle, CURLOPT_SHARE, share_);
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_USERAGENT, agent.c_str());
    curl_easy_setopt(handle, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, timeoutMs);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, connectMs);
    curl_easy_setopt(handle, CURLOPT_DNS_CACHE_TIMEOUT, 300L);
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, cfg.followRedirects ? 1L : 0L);
    curl_easy_setopt(handle, CURLOPT_MAXREDIRS, static_cast<long>(cfg.maxRedirects));
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, cfg.verifySSL ? 1L : 0L);
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, cfg.verifySSL ? 2L : 0L);

    // Empty file name turns on the cookie engine without reading from disk
    curl_easy_setopt(handle, CURLOPT_COOKIEFILE, "");

    if (cfg.proxy.enabled && !cfg.proxy.server.empty()) {
        LOG_TRACE("Using proxy: " + cfg.proxy.server);
        curl_easy_setopt(handle, CURLOPT_PROXY, cfg.proxy.server.c_str());
        if (!cfg.proxy.username.empty()) {
            curl_easy_setopt(handle, CURLOPT_PROXYUSERNAME, cfg.proxy.username.c_str());
            curl_easy_setopt(handle, CURLOPT_PROXYPASSWORD, cfg.proxy.password.c_str());
        }
    }

    struct curl_slist* headerList = nullptr;
    for (const auto& [name, value] : headers) {
        std::string headerStr = name + ": " + value;
        LOG_TRACE("Adding header: " + headerStr);
        headerList = curl_slist_append(headerList, headerStr.c_str());
    }
    if (headerList) {
        curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headerList);
    }

    if (postBody) {
        curl_easy_setopt(handle, CURLOPT_POST, 1L);
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, postBody->c_str());
        curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(postBody->size()));
    }

    std::string responseData;
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &responseData);

    curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(handle, CURLOPT_XFERINFODATA, &cancel);

    CURLcode res = curl_easy_perform(handle);

    if (headerList) {
        curl_slist_free_all(headerList);
    }

    if (res != CURLE_OK) {
        FetchStatus status = FailureClassifier::classifyCurlError(res, cancel.isCancelled());
        const std::string detail = std::string(curl_easy_strerror(res)) + " | errbuf=" + errbuf;
        curl_easy_cleanup(handle);
        FailureClassifier::throwTransferError(status, url, detail);
    }

    TransportResponse response;

    long statusCode = 0;
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &statusCode);
    response.statusCode = static_cast<int>(statusCode);

    char* contentType = nullptr;
    curl_easy_getinfo(handle, CURLINFO_CONTENT_TYPE, &contentType);
    if (contentType) {
        response.contentType = contentType;
    }

    char* finalUrl = nullptr;
    curl_easy_getinfo(handle, CURLINFO_EFFECTIVE_URL, &finalUrl);
    if (finalUrl) {
        response.finalUrl = finalUrl;
        if (response.finalUrl != url) {
            LOG_DEBUG("Final URL (after redirects): " + response.finalUrl);
        }
    }

    response.cookies = readCookies(handle);
    response.content = std::move(responseData);

    LOG_INFO("HTTP " + std::string(postBody ? "POST" : "GET") + " " + url + " -> " +
             std::to_string(response.statusCode) + " (" + std::to_string(response.content.size()) + " bytes)");

    curl_easy_cleanup(handle);
    return response;
}

size_t HttpFetchEngine::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    std::string* responseData = static_cast<std::string*>(userp);
    size_t totalSize = size * nmemb;
    responseData->append(static_cast<char*>(contents), totalSize);
    return totalSize;
}

int HttpFetchEngine::progressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* cancel = static_cast<const CancellationToken*>(clientp);
    // Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK
    return (cancel && cancel->isCancelled()) ? 1 : 0;
}

void HttpFetchEngine::lockShare(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
    auto* self = static_cast<HttpFetchEngine*>(userptr);
    self->shareLocks_[data].lock();
}

void HttpFetchEngine::unlockShare(CURL*, curl_lock_data data, void* userptr) {
    auto* self = static_cast<HttpFetchEngine*>(userptr);
    self->shareLocks_[data].unlock();
}

} // namespace scrape_core::crawler
