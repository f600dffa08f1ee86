#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <curl/curl.h>
#include "../../include/scrape_core/crawler/FetchEngine.h"

namespace scrape_core::crawler {

/**
 * Lightweight transport: one libcurl easy handle per request, all of them
 * attached to a share handle that holds the engine's cookies, DNS cache,
 * TLS sessions and connection pool.
 */
class HttpFetchEngine : public FetchEngine {
public:
    HttpFetchEngine(const FetchConfig& config, std::shared_ptr<RateController> rateController);
    ~HttpFetchEngine() override;

    TransportKind transport() const override { return TransportKind::HTTP; }

    /**
     * Form field name posted for a locator.
     * "#user" -> "user", "[name=x]" / input[name="x"] -> "x", a plain name is
     * used as-is and anything else (".class", compound selectors) falls back to
     * the logical field name.
     */
    static std::string formFieldName(const FormField& field);

protected:
    void openTransport(const SessionHandle& restored) override;
    void closeTransport() override;

    TransportResponse performFetch(const std::string& url,
                                   const FetchRequest& request,
                                   std::chrono::milliseconds timeout,
                                   const common::CancellationToken& cancel) override;

    TransportResponse performSubmit(const LoginForm& form,
                                    const std::string& pageUrl,
                                    const std::string& actionUrl,
                                    std::chrono::milliseconds timeout,
                                    const common::CancellationToken& cancel) override;

    void onSessionAdopted(const SessionHandle& session) override;
    void onSessionInvalidated() override;

private:
    TransportResponse perform(const std::string& url,
                              const std::string* postBody,
                              const std::map<std::string, std::string>& headers,
                              std::chrono::milliseconds timeout,
                              const common::CancellationToken& cancel);

    // Write Netscape cookie lines (or a COOKIELIST command) into the share
    void loadCookies(const std::vector<std::string>& lines);
    static std::vector<Cookie> readCookies(CURL* handle);

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static int progressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                                curl_off_t ultotal, curl_off_t ulnow);
    static void lockShare(CURL* handle, curl_lock_data data, curl_lock_access access, void* userptr);
    static void unlockShare(CURL* handle, curl_lock_data data, void* userptr);

    CURLSH* share_ = nullptr;
    std::mutex shareLocks_[CURL_LOCK_DATA_LAST];
};

} // namespace scrape_core::crawler
