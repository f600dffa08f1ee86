#include <catch2/catch_test_macros.hpp>
#include "BrowserFetchEngine.h"
#include "LocalHttpServer.h"
#include "scrape_core/common/Errors.h"

#include <mutex>
#include <vector>

using namespace scrape_core::crawler;
using namespace scrape_core::common;
using namespace scrape_core::testing;
using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {

std::shared_ptr<RateController> unthrottled() {
    RateLimitConfig config;
    config.baseDelay = 0ms;
    config.jitter = 0ms;
    return std::make_shared<RateController>(config);
}

FetchConfig browserConfig(const LocalHttpServer& browserless) {
    FetchConfig config;
    config.transport = TransportKind::BROWSER;
    config.baseUrl = "https://shop.example";
    config.browserlessUrl = browserless.baseUrl();
    config.requestTimeout = 5000ms;
    return config;
}

// Records every context posted to /function
struct RecordingBrowser {
    std::mutex mutex;
    std::vector<json> contexts;

    std::vector<json> seen() {
        std::lock_guard<std::mutex> lock(mutex);
        return contexts;
    }
};

} // namespace

TEST_CASE("BrowserFetchEngine renders pages through Browserless", "[BrowserFetchEngine]") {
    LocalHttpServer browserless;
    RecordingBrowser browser;
    emulateBrowserless(browserless, [&browser](const json& context) {
        {
            std::lock_guard<std::mutex> lock(browser.mutex);
            browser.contexts.push_back(context);
        }
        RenderedPage page;
        page.url = context.at("url").get<std::string>();
        page.html = "<html><body>rendered " + page.url + "</body></html>";
        page.cookies = json::array({
            {{"name", "session"}, {"value", "xyz"}, {"domain", "shop.example"}, {"path", "/"}, {"expires", -1}}
        });
        if (page.url.find("/gone") != std::string::npos) {
            page.status = 404;
        }
        return page;
    });

    auto rate = unthrottled();
    auto config = browserConfig(browserless);
    config.customHeaders["Accept-Language"] = "de-DE";
    BrowserFetchEngine engine(config, rate);

    SECTION("Fetch returns the rendered document") {
        auto result = engine.fetch("/catalog");
        REQUIRE(result.success());
        REQUIRE(result.transport == TransportKind::BROWSER);
        REQUIRE(result.finalUrl == "https://shop.example/catalog");
        REQUIRE(result.content == "<html><body>rendered https://shop.example/catalog</body></html>");
        REQUIRE(result.contentType == "text/html");

        auto contexts = browser.seen();
        REQUIRE(contexts.size() == 1);
        REQUIRE(contexts[0]["userAgent"] == config.userAgent);
        REQUIRE(contexts[0]["headers"]["Accept-Language"] == "de-DE");
        REQUIRE(contexts[0]["timeout"] == 5000);
        REQUIRE_FALSE(contexts[0].contains("form"));
    }

    SECTION("The browser context and its cookies form the session") {
        auto first = engine.fetch("/catalog");
        REQUIRE(first.newCookies.size() == 1);
        REQUIRE(first.newCookies.front().expires == 0);

        SessionHandle session = engine.exportSession();
        REQUIRE(session.transport == TransportKind::BROWSER);
        REQUIRE(session.contextId.rfind("ctx-", 0) == 0);
        REQUIRE(session.cookies.find("session")->value == "xyz");

        engine.fetch("/cart");
        auto contexts = browser.seen();
        REQUIRE(contexts.size() == 2);
        REQUIRE(contexts[1]["cookies"].size() == 1);
        REQUIRE(contexts[1]["cookies"][0]["name"] == "session");
    }

    SECTION("A non-2xx main response is an HttpStatusError") {
        REQUIRE_THROWS_AS(engine.fetch("/gone"), HttpStatusError);
        REQUIRE(rate->getTargetState("https://shop.example").consecutiveErrors == 1);
    }

    SECTION("Close drops the browser context") {
        engine.initialize();
        REQUIRE_FALSE(engine.exportSession().contextId.empty());
        engine.close();
        REQUIRE(engine.exportSession().contextId.empty());
        REQUIRE(browserless.requestCount("/health") == 1);
    }
}

TEST_CASE("BrowserFetchEngine fills and submits forms in the page", "[BrowserFetchEngine][Form]") {
    LocalHttpServer browserless;
    RecordingBrowser browser;
    emulateBrowserless(browserless, [&browser](const json& context) {
        std::lock_guard<std::mutex> lock(browser.mutex);
        browser.contexts.push_back(context);
        RenderedPage page;
        page.url = "https://shop.example/account";
        page.html = "<a href=\"/logout\">Logout</a>";
        return page;
    });

    BrowserFetchEngine engine(browserConfig(browserless), unthrottled());

    LoginForm form;
    form.pageUrl = "/login";
    form.fields = {{"username", "#user", "jo"}, {"password", "#pass", "pw"}};
    form.hiddenFields = {{"csrf_token", "ignored-by-browser"}};
    form.passwordLocator = "#pass";

    SECTION("Clicks the submit element when one is given") {
        form.submitLocator = "#go";
        auto result = engine.submitForm(form);
        REQUIRE(result.finalUrl == "https://shop.example/account");

        auto context = browser.seen().front();
        REQUIRE(context["url"] == "https://shop.example/login");
        REQUIRE(context["form"]["submit"] == "#go");
        REQUIRE(context["form"]["fields"].size() == 2);
        REQUIRE(context["form"]["fields"][0]["locator"] == "#user");
        REQUIRE(context["form"]["fields"][1]["value"] == "pw");
    }

    SECTION("Presses Enter in the password field otherwise") {
        engine.submitForm(form);
        auto context = browser.seen().front();
        REQUIRE(context["form"]["submit"] == "");
        REQUIRE(context["form"]["pressEnterIn"] == "#pass");
    }

    SECTION("Needs some way to submit") {
        form.fields.clear();
        form.passwordLocator.clear();
        REQUIRE_THROWS_AS(engine.submitForm(form), ConfigurationError);
    }
}

TEST_CASE("BrowserFetchEngine transport failures", "[BrowserFetchEngine]") {
    auto rate = unthrottled();

    SECTION("Unreachable Browserless fails initialization") {
        LocalHttpServer gone;
        auto config = browserConfig(gone);
        gone.stop();
        BrowserFetchEngine engine(config, rate);
        REQUIRE_THROWS_AS(engine.initialize(), NetworkError);
        REQUIRE_FALSE(engine.isInitialized());
    }

    SECTION("Browserless timeout maps to TimeoutError") {
        LocalHttpServer browserless;
        emulateBrowserless(browserless, [](const json&) { return RenderedPage{}; });
        browserless.route("POST", "/function", [](const HttpRequest&) {
            HttpResponse response;
            response.status = 408;
            response.body = "Timed out waiting for page";
            return response;
        });
        BrowserFetchEngine engine(browserConfig(browserless), rate);
        REQUIRE_THROWS_AS(engine.fetch("/slow"), TimeoutError);
    }

    SECTION("Malformed Browserless response maps to NetworkError") {
        LocalHttpServer browserless;
        emulateBrowserless(browserless, [](const json&) { return RenderedPage{}; });
        browserless.route("POST", "/function", [](const HttpRequest&) {
            HttpResponse response;
            response.contentType = "application/json";
            response.body = "{not json";
            return response;
        });
        BrowserFetchEngine engine(browserConfig(browserless), rate);
        REQUIRE_THROWS_AS(engine.fetch("/page"), NetworkError);
    }

    SECTION("Token is passed on every Browserless call") {
        LocalHttpServer browserless;
        emulateBrowserless(browserless, [](const json& context) {
            RenderedPage page;
            page.url = context.at("url").get<std::string>();
            return page;
        });
        auto config = browserConfig(browserless);
        config.browserlessToken = "s3cret";
        BrowserFetchEngine engine(config, rate);
        engine.fetch("/page");

        for (const auto& request : browserless.requests()) {
            REQUIRE(request.query.find("token=s3cret") != std::string::npos);
        }
    }
}

TEST_CASE("Browserless page script drives the documented context", "[BrowserlessClient]") {
    const std::string& script = BrowserlessClient::pageScript();
    REQUIRE(script.find("module.exports") == 0);
    for (const char* key : {"context.url", "context.cookies", "context.form", "pressEnterIn", "page.cookies()"}) {
        REQUIRE(script.find(key) != std::string::npos);
    }
}
