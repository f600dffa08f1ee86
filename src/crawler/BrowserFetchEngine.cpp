#include "BrowserFetchEngine.h"
#include "FailureClassifier.h"
#include "../../include/scrape_core/common/Errors.h"
#include "../../include/Logger.h"

#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace scrape_core::crawler {

using namespace scrape_core::common;
using std::chrono::milliseconds;

namespace {

std::string newContextId() {
    static std::mutex mutex;
    static std::mt19937_64 rng{std::random_device{}()};
    std::lock_guard<std::mutex> lock(mutex);
    std::ostringstream id;
    id << "ctx-" << std::hex << std::setw(16) << std::setfill('0') << rng();
    return id.str();
}

} // namespace

BrowserFetchEngine::BrowserFetchEngine(const FetchConfig& config, std::shared_ptr<RateController> rateController)
    : FetchEngine(config, std::move(rateController)) {
    LOG_DEBUG("BrowserFetchEngine created, Browserless endpoint: " + config.browserlessUrl);
}

BrowserFetchEngine::~BrowserFetchEngine() {
    shutdown();
}

void BrowserFetchEngine::openTransport(const SessionHandle& restored) {
    if (client_) {
        LOG_WARNING("Browser context " + contextId_ + " still open, dropping it before reopening");
        closeTransport();
    }
    const FetchConfig& cfg = config();
    auto client = std::make_unique<BrowserlessClient>(cfg.browserlessUrl, cfg.browserlessToken);
    if (!client->isAvailable()) {
        LOG_ERROR("Browserless endpoint unavailable: " + cfg.browserlessUrl);
        throw NetworkError("Browserless endpoint unavailable: " + cfg.browserlessUrl, cfg.browserlessUrl);
    }
    client->setUserAgent(userAgent());
    client->setProxy(cfg.proxy);
    client->setVerifySSL(cfg.verifySSL);

    client_ = std::move(client);
    contextId_ = newContextId();
    LOG_INFO("Browser context " + contextId_ + " created with " +
             std::to_string(restored.cookies.size()) + " restored cookies");
}

void BrowserFetchEngine::closeTransport() {
    if (client_) {
        LOG_DEBUG("Dropping browser context " + contextId_);
    }
    client_.reset();
    contextId_.clear();
}

FetchEngine::TransportResponse BrowserFetchEngine::performFetch(const std::string& url,
                                                                const FetchRequest& request,
                                                                milliseconds timeout,
                                                                const CancellationToken& cancel) {
    BrowserlessRenderRequest render_request;
    render_request.url = url;
    render_request.timeout_ms = static_cast<int>(timeout.count());
    render_request.headers = requestHeaders(request.headers);
    return render(std::move(render_request), cancel);
}

FetchEngine::TransportResponse BrowserFetchEngine::performSubmit(const LoginForm& form,
                                                                 const std::string& pageUrl,
                                                                 const std::string&,
                                                                 milliseconds timeout,
                                                                 const CancellationToken& cancel) {
    BrowserFormAction action;
    for (const auto& field : form.fields) {
        action.fields.push_back({field.locator, field.value});
    }
    action.submitLocator = form.submitLocator;
    if (action.submitLocator.empty()) {
        action.pressEnterIn = !form.passwordLocator.empty() || form.fields.empty()
                                  ? form.passwordLocator
                                  : form.fields.back().locator;
        if (action.pressEnterIn.empty()) {
            throw ConfigurationError("Browser form submission needs a submit or password locator");
        }
    }
    // Hidden inputs travel with the page's own form

    BrowserlessRenderRequest render_request;
    render_request.url = pageUrl;
    render_request.timeout_ms = static_cast<int>(timeout.count());
    render_request.headers = requestHeaders({});
    render_request.form = std::move(action);
    return render(std::move(render_request), cancel);
}

FetchEngine::TransportResponse BrowserFetchEngine::render(BrowserlessRenderRequest request,
                                                          const CancellationToken& cancel) {
    if (!client_) {
        throw CancelledError("Browser transport is closed: " + request.url, request.url);
    }
    request.cookies = exportSession().cookies.all();

    const std::string url = request.url;
    BrowserlessRenderResult rendered = client_->renderUrl(request, cancel);
    if (!rendered.success) {
        FailureClassifier::throwTransferError(rendered.failure, url, rendered.error);
    }

    TransportResponse response;
    response.finalUrl = rendered.finalUrl;
    response.content = std::move(rendered.html);
    response.contentType = "text/html";
    // 0 when the page never produced a main response (served from cache, about:blank)
    response.statusCode = rendered.status_code > 0 ? rendered.status_code : 200;
    response.cookies = std::move(rendered.cookies);
    return response;
}

} // namespace scrape_core::crawler
