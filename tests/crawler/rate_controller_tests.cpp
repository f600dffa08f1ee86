#include <catch2/catch_test_macros.hpp>
#include "scrape_core/crawler/RateController.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace scrape_core::crawler;
using scrape_core::common::CancellationToken;
using namespace std::chrono_literals;

namespace {

RateLimitConfig noJitter(std::chrono::milliseconds baseDelay) {
    RateLimitConfig config;
    config.baseDelay = baseDelay;
    config.jitter = 0ms;
    return config;
}

void fail(RateController& controller, const std::string& target, int times) {
    for (int i = 0; i < times; ++i) {
        controller.report(target, FetchOutcome::FAILURE);
    }
}

} // namespace

TEST_CASE("RateController spaces requests to the same target", "[RateController]") {
    RateController controller(noJitter(1000ms));
    const std::string target = "https://example.com";

    SECTION("Two sequential admissions start at least base_delay apart") {
        auto first = controller.admit(target);
        REQUIRE(first.granted());
        auto firstStart = std::chrono::steady_clock::now();
        first.release();

        auto second = controller.admit(target);
        auto secondStart = std::chrono::steady_clock::now();
        REQUIRE(second.granted());
        REQUIRE(secondStart - firstStart >= 990ms);
        REQUIRE(second.waited() >= 900ms);
    }

    SECTION("A new target is admitted immediately") {
        auto first = controller.admit(target);
        first.release();
        auto start = std::chrono::steady_clock::now();
        auto other = controller.admit("https://other.example");
        REQUIRE(other.granted());
        REQUIRE(std::chrono::steady_clock::now() - start < 500ms);
    }

    SECTION("Unknown targets report no delay") {
        REQUIRE(controller.getDelay("https://never.example") == 0ms);
        REQUIRE(controller.getTargetState("https://never.example").baseDelay == 1000ms);
    }
}

TEST_CASE("RateController backs off after consecutive failures", "[RateController]") {
    RateController controller(noJitter(1000ms));
    controller.setRandomSeed(42);
    const std::string target = "https://flaky.example";

    SECTION("Three failures double the delay and a success restores it") {
        fail(controller, target, 3);
        auto state = controller.getTargetState(target);
        REQUIRE(state.consecutiveErrors == 3);
        REQUIRE(state.currentDelay >= 1600ms);
        REQUIRE(state.currentDelay <= 2400ms);

        auto delay = controller.getDelay(target);
        REQUIRE(delay >= 1500ms);
        REQUIRE(delay <= 2400ms);

        controller.report(target, FetchOutcome::SUCCESS);
        state = controller.getTargetState(target);
        REQUIRE(state.consecutiveErrors == 0);
        REQUIRE(state.currentDelay == 1000ms);
        REQUIRE(controller.getDelay(target) <= 1000ms);
    }

    SECTION("Fewer failures than the threshold keep the base delay") {
        fail(controller, target, 2);
        REQUIRE(controller.getTargetState(target).currentDelay == 1000ms);
    }

    SECTION("Delay never shrinks while failures continue and is capped") {
        std::chrono::milliseconds previous{0};
        for (int i = 1; i <= 9; ++i) {
            controller.report(target, FetchOutcome::FAILURE);
            auto current = controller.getTargetState(target).currentDelay;
            REQUIRE(current >= previous);
            REQUIRE(current <= controller.config().maxBackoffDelay);
            previous = current;
        }
    }

    SECTION("Ten failures force a cool-down of at least an hour") {
        fail(controller, target, 10);
        auto state = controller.getTargetState(target);
        REQUIRE(state.coolingDown);
        REQUIRE(state.currentDelay >= 3600s);
        REQUIRE(controller.getDelay(target) >= 3599s);

        controller.report(target, FetchOutcome::SUCCESS);
        REQUIRE_FALSE(controller.getTargetState(target).coolingDown);
        REQUIRE(controller.getTargetState(target).currentDelay == 1000ms);
    }
}

TEST_CASE("RateController backoff with a zero base delay", "[RateController]") {
    RateController controller(noJitter(0ms));
    const std::string target = "https://zero.example";

    fail(controller, target, 3);
    auto delay = controller.getTargetState(target).currentDelay;
    REQUIRE(delay >= 1600ms);
    REQUIRE(delay <= 2400ms);
}

TEST_CASE("RateController per-target overrides", "[RateController]") {
    auto config = noJitter(1000ms);
    config.perTargetOverrides["https://slow.example"] = 2500ms;
    RateController controller(config);

    REQUIRE(controller.getTargetState("https://slow.example").baseDelay == 2500ms);
    REQUIRE(controller.getTargetState("https://fast.example").baseDelay == 1000ms);
}

TEST_CASE("RateController enforces the global concurrency limit", "[RateController]") {
    auto config = noJitter(0ms);
    config.concurrency = 2;
    RateController controller(config);

    std::atomic<int> active{0};
    std::atomic<int> maxSeen{0};
    std::atomic<int> granted{0};
    std::vector<std::thread> workers;
    for (int i = 0; i < 6; ++i) {
        workers.emplace_back([&, i] {
            auto permit = controller.admit("https://site" + std::to_string(i) + ".example");
            if (permit.granted()) {
                ++granted;
            }
            int now = ++active;
            int seen = maxSeen.load();
            while (now > seen && !maxSeen.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(30ms);
            --active;
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    REQUIRE(granted.load() == 6);
    REQUIRE(maxSeen.load() <= 2);
    REQUIRE(maxSeen.load() >= 1);
    REQUIRE(controller.inFlight() == 0);
}

TEST_CASE("RateController admission can be cancelled", "[RateController]") {
    SECTION("While waiting for a concurrency slot") {
        auto config = noJitter(0ms);
        config.concurrency = 1;
        RateController controller(config);

        auto held = controller.admit("https://a.example");
        REQUIRE(held.granted());

        CancellationToken token;
        std::thread canceller([token]() mutable {
            std::this_thread::sleep_for(100ms);
            token.cancel();
        });
        auto blocked = controller.admit("https://b.example", token);
        canceller.join();

        REQUIRE_FALSE(blocked.granted());
        REQUIRE(controller.inFlight() == 1);
    }

    SECTION("While sleeping out the spacing delay") {
        RateController controller(noJitter(5000ms));
        controller.admit("https://a.example").release();

        CancellationToken token;
        std::thread canceller([token]() mutable {
            std::this_thread::sleep_for(100ms);
            token.cancel();
        });
        auto start = std::chrono::steady_clock::now();
        auto permit = controller.admit("https://a.example", token);
        canceller.join();

        REQUIRE_FALSE(permit.granted());
        REQUIRE(std::chrono::steady_clock::now() - start < 3s);
        REQUIRE(controller.inFlight() == 0);
    }

    SECTION("A cancelled admission does not push back the next one") {
        RateController controller(noJitter(1000ms));
        const std::string target = "https://a.example";
        controller.admit(target).release();
        const auto firstStart = controller.getTargetState(target).lastRequest;

        CancellationToken token;
        std::thread canceller([token]() mutable {
            std::this_thread::sleep_for(100ms);
            token.cancel();
        });
        auto cancelled = controller.admit(target, token);
        canceller.join();
        REQUIRE_FALSE(cancelled.granted());
        REQUIRE(controller.getTargetState(target).lastRequest == firstStart);

        // spaced from the first admission, not from the abandoned reservation
        auto next = controller.admit(target);
        REQUIRE(next.granted());
        REQUIRE(next.waited() >= 700ms);
        REQUIRE(next.waited() < 1500ms);
    }
}

TEST_CASE("Permit gives its slot back exactly once", "[RateController]") {
    RateController controller(noJitter(0ms));

    auto permit = controller.admit("https://a.example");
    REQUIRE(controller.inFlight() == 1);

    Permit moved = std::move(permit);
    REQUIRE_FALSE(permit.granted());
    REQUIRE(moved.granted());
    REQUIRE(moved.target() == "https://a.example");

    moved.release();
    moved.release();
    REQUIRE(controller.inFlight() == 0);

    {
        auto scoped = controller.admit("https://a.example");
        REQUIRE(controller.inFlight() == 1);
    }
    REQUIRE(controller.inFlight() == 0);
}

TEST_CASE("RateController evicts idle targets beyond the tracking limit", "[RateController]") {
    auto config = noJitter(0ms);
    config.maxTrackedTargets = 3;
    RateController controller(config);

    fail(controller, "https://failing.example", 1);
    for (int i = 0; i < 5; ++i) {
        controller.admit("https://site" + std::to_string(i) + ".example").release();
    }

    REQUIRE(controller.trackedTargets() <= 3);
    REQUIRE(controller.getTargetState("https://failing.example").consecutiveErrors == 1);
}
