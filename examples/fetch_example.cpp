#include "../include/scrape_core/auth/SessionNegotiator.h"
#include "../include/scrape_core/common/Errors.h"
#include "../include/scrape_core/crawler/FetchEngine.h"
#include "../include/Logger.h"
#include <fstream>
#include <iostream>
#include <future>
#include <vector>

using namespace scrape_core;
using json = nlohmann::json;

// Site file layout:
// {
//   "fetch": {"base_url": "https://shop.example", "transport": "http"},
//   "rate_limit": {"base_delay": 1.0, "jitter": 0.5, "concurrency": 2},
//   "login": {"login_url": "/login", "credentials_key": "shop",
//             "form_selectors": {"username": "#user", "password": "#pass", "submit": "#go"}},
//   "credential_store": {"secure_storage": true, "allow_prompt": true}
// }
int main(int argc, char* argv[]) {
    Logger::getInstance().init(LogLevel::INFO, true);
    Logger::getInstance().initFromEnvironment();

    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <site.json> <url> [url...]\n";
        return 2;
    }

    json site;
    {
        std::ifstream file(argv[1]);
        if (!file) {
            std::cerr << "Cannot open " << argv[1] << "\n";
            return 2;
        }
        site = json::parse(file, nullptr, false);
        if (site.is_discarded() || !site.is_object()) {
            std::cerr << argv[1] << " is not a JSON object\n";
            return 2;
        }
    }

    try {
        auto fetchConfig = crawler::FetchConfig::fromJson(site.value("fetch", json::object()));
        fetchConfig.applyEnvironmentOverrides();
        auto rateController = std::make_shared<crawler::RateController>(
            crawler::RateLimitConfig::fromJson(site.value("rate_limit", json::object())));
        auto engine = crawler::createFetchEngine(fetchConfig, rateController);

        if (site.contains("login")) {
            auth::CredentialStore store(auth::CredentialStoreOptions::fromJson(site.value("credential_store", json::object())));
            auto login = auth::LoginConfig::fromJson(site["login"]);
            auth::SessionNegotiator negotiator(login.verifier);
            auto session = negotiator.login(*engine, login, store);
            std::cout << "Logged in, " << session.cookies.size() << " cookies\n";
        }

        std::vector<std::pair<std::string, std::future<crawler::FetchResult>>> pending;
        for (int i = 2; i < argc; ++i) {
            pending.emplace_back(argv[i], engine->fetchAsync(crawler::FetchRequest(argv[i])));
        }

        int failures = 0;
        for (auto& [url, future] : pending) {
            try {
                auto result = future.get();
                std::cout << result.statusCode << "  " << result.content.size() << " bytes  "
                          << result.elapsed.count() << "ms  " << result.finalUrl << "\n";
            } catch (const common::FetchError& e) {
                failures++;
                std::cout << crawler::fetchStatusToString(e.status()) << "  " << url << "  " << e.what() << "\n";
            }
        }

        engine->close();
        return failures == 0 ? 0 : 1;
    } catch (const common::ScrapeError& e) {
        LOG_ERROR(std::string("Fatal: ") + e.what());
        return 1;
    }
}
