#include "../../include/scrape_core/crawler/FetchEngine.h"
#include "../../include/scrape_core/common/Errors.h"
#include "../../include/scrape_core/common/UrlUtils.h"
#include "../../include/scrape_core/common/UserAgents.h"
#include "../../include/Logger.h"
#include "FailureClassifier.h"
#include "HttpFetchEngine.h"
#include "BrowserFetchEngine.h"

namespace scrape_core::crawler {

using namespace scrape_core::common;
using std::chrono::duration_cast;
using std::chrono::milliseconds;
using std::chrono::steady_clock;

// Registers one in-flight operation so close() can wait for it
class FetchEngine::ActivityScope {
public:
    ActivityScope(FetchEngine& engine, const std::string& url) : engine_(engine) {
        std::lock_guard<std::mutex> lock(engine_.stateMutex_);
        if (!engine_.initialized_ || engine_.closing_) {
            throw CancelledError("Fetch engine closed: " + url, url);
        }
        engine_.active_++;
        token_ = engine_.cancel_;
    }

    ~ActivityScope() {
        {
            std::lock_guard<std::mutex> lock(engine_.stateMutex_);
            engine_.active_--;
        }
        engine_.drained_.notify_all();
    }

    const CancellationToken& token() const { return token_; }

private:
    FetchEngine& engine_;
    CancellationToken token_;
};

FetchEngine::FetchEngine(const FetchConfig& config, std::shared_ptr<RateController> rateController)
    : config_(config), rateController_(std::move(rateController)) {
    if (!rateController_) {
        throw ConfigurationError("FetchEngine requires a RateController");
    }
    config_.validate();
    session_.transport = config_.transport;
}

FetchEngine::~FetchEngine() = default;

void FetchEngine::initialize() {
    std::unique_lock<std::mutex> lock(stateMutex_);
    lifecycle_.wait(lock, [this] { return !closing_; });
    openLocked();
}

void FetchEngine::ensureOpen(const std::string& url) {
    std::unique_lock<std::mutex> lock(stateMutex_);
    if (closing_) {
        throw CancelledError("Fetch engine is closing: " + url, url);
    }
    openLocked();
}

void FetchEngine::openLocked() {
    if (initialized_) {
        return;
    }

    cancel_ = CancellationToken();
    {
        std::lock_guard<std::mutex> sessionLock(sessionMutex_);
        userAgent_ = config_.rotateUserAgent ? randomDesktopUserAgent() : config_.userAgent;
    }

    SessionHandle restored = exportSession();
    openTransport(restored);
    {
        std::lock_guard<std::mutex> sessionLock(sessionMutex_);
        session_.contextId = contextId();
    }
    initialized_ = true;

    LOG_INFO("Fetch engine initialized (" + transportKindToString(transport()) + ", " +
             std::to_string(restored.cookies.size()) + " cookies restored)");
}

void FetchEngine::close() {
    shutdown();
}

void FetchEngine::shutdown() {
    std::unique_lock<std::mutex> lock(stateMutex_);
    // A concurrent close() owns the teardown; return once it is done
    lifecycle_.wait(lock, [this] { return !closing_; });
    if (!initialized_) {
        return;
    }
    closing_ = true;
    cancel_.cancel();

    if (active_ > 0) {
        LOG_INFO("Closing fetch engine, waiting for " + std::to_string(active_) + " in-flight operations");
    }
    drained_.wait(lock, [this] { return active_ == 0; });

    closeTransport();
    {
        std::lock_guard<std::mutex> sessionLock(sessionMutex_);
        session_.cookies.clear();
        session_.contextId.clear();
    }
    initialized_ = false;
    closing_ = false;
    lock.unlock();
    lifecycle_.notify_all();
    LOG_INFO("Fetch engine closed (" + transportKindToString(transport()) + ")");
}

bool FetchEngine::isInitialized() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return initialized_;
}

bool FetchEngine::isClosing() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return closing_;
}

SessionHandle FetchEngine::exportSession() const {
    std::lock_guard<std::mutex> lock(sessionMutex_);
    return session_;
}

void FetchEngine::adoptSession(const SessionHandle& session) {
    if (session.transport != config_.transport) {
        LOG_WARNING("Adopting a " + transportKindToString(session.transport) + " session into a " +
                    transportKindToString(config_.transport) + " engine; only cookies carry over");
    }
    {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        session_.cookies.merge(session.cookies.all());
    }
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (initialized_ && !closing_) {
        onSessionAdopted(session);
    }
    LOG_DEBUG("Adopted session with " + std::to_string(session.cookies.size()) + " cookies");
}

void FetchEngine::invalidateSession() {
    {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        session_.cookies.clear();
    }
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (initialized_ && !closing_) {
            onSessionInvalidated();
        }
    }
    LOG_INFO("Session invalidated");
}

std::string FetchEngine::normalizeUrl(const std::string& url) const {
    std::string cleaned = sanitizeUrl(url);
    if (cleaned != url) {
        LOG_DEBUG("URL sanitized: " + std::to_string(url.size() - cleaned.size()) + " bytes dropped -> " + cleaned);
    }
    if (isAbsoluteUrl(cleaned)) {
        return cleaned;
    }
    if (config_.baseUrl.empty()) {
        throw ConfigurationError("Relative URL '" + cleaned + "' requires base_url to be configured");
    }
    return resolveUrl(config_.baseUrl, cleaned);
}

std::map<std::string, std::string> FetchEngine::requestHeaders(const std::map<std::string, std::string>& extra) const {
    std::map<std::string, std::string> headers = config_.customHeaders;
    for (const auto& [name, value] : extra) {
        headers[name] = value;
    }
    return headers;
}

std::string FetchEngine::userAgent() const {
    std::lock_guard<std::mutex> lock(sessionMutex_);
    return userAgent_.empty() ? config_.userAgent : userAgent_;
}

FetchResult FetchEngine::fetch(const FetchRequest& request) {
    ensureOpen(request.url);

    const std::string url = appendQuery(normalizeUrl(request.url), request.params);
    if (request.transportHint && *request.transportHint != transport()) {
        LOG_DEBUG("Transport hint " + transportKindToString(*request.transportHint) + " ignored by " +
                  transportKindToString(transport()) + " engine");
    }
    const milliseconds timeout = request.timeout.value_or(config_.requestTimeout);

    LOG_DEBUG("Fetching " + url + " via " + transportKindToString(transport()));
    return execute(url, [&](const CancellationToken& cancel) {
        return performFetch(url, request, timeout, cancel);
    });
}

std::future<FetchResult> FetchEngine::fetchAsync(FetchRequest request) {
    return std::async(std::launch::async, [this, request = std::move(request)]() {
        return fetch(request);
    });
}

FetchResult FetchEngine::submitForm(const LoginForm& form) {
    ensureOpen(form.pageUrl);

    const std::string pageUrl = normalizeUrl(form.pageUrl);
    const std::string actionUrl = form.actionUrl.empty() ? pageUrl : normalizeUrl(form.actionUrl);
    const milliseconds timeout = form.timeout.value_or(config_.requestTimeout);

    LOG_INFO("Submitting form on " + pageUrl + " (" + std::to_string(form.fields.size()) + " fields)");
    return execute(actionUrl, [&](const CancellationToken& cancel) {
        return performSubmit(form, pageUrl, actionUrl, timeout, cancel);
    });
}

FetchResult FetchEngine::execute(const std::string& url,
                                 const std::function<TransportResponse(const CancellationToken&)>& operation) {
    ActivityScope activity(*this, url);
    const std::string target = targetOf(url);
    const auto started = steady_clock::now();

    Permit permit = rateController_->admit(target, activity.token());
    if (!permit) {
        throw CancelledError("Fetch cancelled before admission: " + url, url);
    }

    TransportResponse response;
    try {
        response = operation(activity.token());
    } catch (const CancelledError&) {
        // Not the target's fault; leave its failure count alone
        throw;
    } catch (const FetchError&) {
        rateController_->report(target, FetchOutcome::FAILURE);
        throw;
    } catch (const ConfigurationError&) {
        throw;
    } catch (const std::exception& e) {
        rateController_->report(target, FetchOutcome::FAILURE);
        LOG_ERROR("Unexpected transport failure for " + url + ": " + e.what());
        throw NetworkError(std::string("Unexpected transport failure: ") + e.what(), url);
    }

    if (classifyHttpStatus(response.statusCode) != FetchStatus::SUCCESS) {
        rateController_->report(target, FetchOutcome::FAILURE);
        FailureClassifier::throwStatusError(url, response.statusCode, response.content);
    }

    FetchResult result;
    result.url = url;
    result.finalUrl = response.finalUrl.empty() ? url : response.finalUrl;
    result.content = std::move(response.content);
    result.contentType = std::move(response.contentType);
    result.statusCode = response.statusCode;
    result.status = FetchStatus::SUCCESS;
    result.transport = transport();
    {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        result.newCookies = session_.cookies.merge(response.cookies);
    }
    result.elapsed = duration_cast<milliseconds>(steady_clock::now() - started);

    rateController_->report(target, FetchOutcome::SUCCESS);

    LOG_DEBUG("Fetched " + result.finalUrl + " (" + std::to_string(result.statusCode) + ", " +
              std::to_string(result.content.size()) + " bytes, " +
              std::to_string(result.elapsed.count()) + "ms)");
    return result;
}

std::unique_ptr<FetchEngine> createFetchEngine(const FetchConfig& config,
                                               std::shared_ptr<RateController> rateController) {
    switch (config.transport) {
        case TransportKind::HTTP:
            return std::make_unique<HttpFetchEngine>(config, std::move(rateController));
        case TransportKind::BROWSER:
            return std::make_unique<BrowserFetchEngine>(config, std::move(rateController));
    }
    throw ConfigurationError("Unsupported transport: " + transportKindToString(config.transport));
}

} // namespace scrape_core::crawler
