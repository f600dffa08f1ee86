#pragma once

#include <chrono>
#include <memory>
#include <string>
#include "../../include/scrape_core/crawler/BrowserlessClient.h"
#include "../../include/scrape_core/crawler/FetchEngine.h"

namespace scrape_core::crawler {

/**
 * Full-browser transport. Pages are rendered by a remote headless Chrome
 * behind Browserless; the engine keeps the cookie jar of its isolated
 * context and replays it into every page it opens.
 */
class BrowserFetchEngine : public FetchEngine {
public:
    BrowserFetchEngine(const FetchConfig& config, std::shared_ptr<RateController> rateController);
    ~BrowserFetchEngine() override;

    TransportKind transport() const override { return TransportKind::BROWSER; }

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

    std::string contextId() const override { return contextId_; }

private:
    TransportResponse render(BrowserlessRenderRequest request, const common::CancellationToken& cancel);

    std::unique_ptr<BrowserlessClient> client_;
    std::string contextId_;
};

} // namespace scrape_core::crawler
