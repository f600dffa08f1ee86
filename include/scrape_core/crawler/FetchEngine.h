#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "RateController.h"
#include "SessionHandle.h"
#include "models/FetchConfig.h"
#include "models/FetchRequest.h"
#include "models/FetchResult.h"
#include "../common/CancellationToken.h"

namespace scrape_core::crawler {

/**
 * Page retrieval over one fixed transport. Every request goes through the
 * shared RateController for admission and reports its outcome back to it.
 * Transport variants implement the protected hooks; callers only ever see
 * this interface.
 *
 * Thread-safe: fetch/fetchAsync/submitForm may run concurrently. close()
 * cancels in-flight work and waits for it to drain.
 */
class FetchEngine {
public:
    FetchEngine(const FetchConfig& config, std::shared_ptr<RateController> rateController);
    virtual ~FetchEngine();

    FetchEngine(const FetchEngine&) = delete;
    FetchEngine& operator=(const FetchEngine&) = delete;

    /**
     * Idempotent. Creates the transport resource and restores captured cookies into it.
     * Waits for a close() in progress to finish before reopening.
     */
    void initialize();

    /**
     * Fetch one page. Initializes the engine on first use.
     * @throws common::CancelledError while close() is draining the engine
     * @throws common::FetchError subtype on transport failure or non-2xx status
     * @throws common::ConfigurationError for a relative URL without a base URL
     */
    FetchResult fetch(const FetchRequest& request);

    // Runs fetch() on a worker thread; errors surface from future::get()
    std::future<FetchResult> fetchAsync(FetchRequest request);

    // Submit a login form through the admission path (see LoginForm)
    FetchResult submitForm(const LoginForm& form);

    // Idempotent; a never-initialized engine is a no-op
    void close();

    bool isInitialized() const;
    // True while close() waits for in-flight work and releases the transport
    bool isClosing() const;
    virtual TransportKind transport() const = 0;
    const FetchConfig& config() const { return config_; }
    RateController& rateController() { return *rateController_; }

    // Snapshot of the live session state
    SessionHandle exportSession() const;

    // Merge a session's cookies into this engine (pushed into the transport if live)
    void adoptSession(const SessionHandle& session);

    // Forget all cookies and the browser context
    void invalidateSession();

    // Absolute form of a possibly relative URL
    std::string normalizeUrl(const std::string& url) const;

protected:
    struct TransportResponse {
        std::string finalUrl;
        std::string content;
        std::string contentType;
        int statusCode = 0;
        // Full cookie state of the transport after the request
        std::vector<Cookie> cookies;
    };

    // Called under the lifecycle lock; may throw FetchError to fail initialize()
    virtual void openTransport(const SessionHandle& restored) = 0;
    // Called once per successful openTransport, after in-flight work drained
    virtual void closeTransport() = 0;

    virtual TransportResponse performFetch(const std::string& url,
                                           const FetchRequest& request,
                                           std::chrono::milliseconds timeout,
                                           const common::CancellationToken& cancel) = 0;

    virtual TransportResponse performSubmit(const LoginForm& form,
                                            const std::string& pageUrl,
                                            const std::string& actionUrl,
                                            std::chrono::milliseconds timeout,
                                            const common::CancellationToken& cancel) = 0;

    // Identity of the isolated context created by openTransport, empty if none
    virtual std::string contextId() const { return ""; }

    virtual void onSessionAdopted(const SessionHandle&) {}
    virtual void onSessionInvalidated() {}

    // Configured custom headers merged with per-request headers
    std::map<std::string, std::string> requestHeaders(const std::map<std::string, std::string>& extra) const;
    std::string userAgent() const;

    // Derived destructors call this so closeTransport still dispatches to them
    void shutdown();

private:
    class ActivityScope;

    // Open on first use; a fetch arriving during close() is cancelled instead
    void ensureOpen(const std::string& url);
    // Requires stateMutex_ held and no close in progress
    void openLocked();

    FetchResult execute(const std::string& url,
                        const std::function<TransportResponse(const common::CancellationToken&)>& operation);

    FetchConfig config_;
    std::shared_ptr<RateController> rateController_;

    mutable std::mutex stateMutex_;
    std::condition_variable drained_;
    std::condition_variable lifecycle_;
    bool initialized_ = false;
    bool closing_ = false;
    size_t active_ = 0;
    common::CancellationToken cancel_;
    std::string userAgent_;

    mutable std::mutex sessionMutex_;
    SessionHandle session_;
};

/**
 * Build the engine variant selected by config.transport.
 * @throws common::ConfigurationError if the configuration is inconsistent
 */
std::unique_ptr<FetchEngine> createFetchEngine(const FetchConfig& config,
                                               std::shared_ptr<RateController> rateController);

} // namespace scrape_core::crawler
