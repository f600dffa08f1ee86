#include "../../include/scrape_core/crawler/RateController.h"
#include "../../include/Logger.h"

#include <algorithm>
#include <cmath>
#include <vector>

namespace scrape_core::crawler {

using std::chrono::duration_cast;
using std::chrono::milliseconds;
using std::chrono::steady_clock;

namespace {

// Slot waits re-check the cancellation token at this interval
constexpr milliseconds kSlotPollInterval{50};

} // namespace

Permit::Permit(RateController* owner, std::string target, milliseconds waited)
    : owner_(owner), target_(std::move(target)), waited_(waited) {}

Permit::~Permit() {
    release();
}

Permit::Permit(Permit&& other) noexcept
    : owner_(other.owner_), target_(std::move(other.target_)), waited_(other.waited_) {
    other.owner_ = nullptr;
}

Permit& Permit::operator=(Permit&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = other.owner_;
        target_ = std::move(other.target_);
        waited_ = other.waited_;
        other.owner_ = nullptr;
    }
    return *this;
}

void Permit::release() {
    if (owner_) {
        RateController* owner = owner_;
        owner_ = nullptr;
        owner->releaseSlot(target_);
    }
}

RateController::RateController(const RateLimitConfig& config)
    : config_(config), rng_(std::random_device{}()) {
    if (config_.concurrency == 0) {
        config_.concurrency = 1;
    }
    LOG_DEBUG("RateController initialized: concurrency=" + std::to_string(config_.concurrency) +
              ", base delay=" + std::to_string(config_.baseDelay.count()) + "ms" +
              ", jitter=" + std::to_string(config_.jitter.count()) + "ms");
}

RateController::~RateController() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (inFlight_ > 0) {
        LOG_WARNING("RateController destroyed with " + std::to_string(inFlight_) + " permits still held");
    }
}

Permit RateController::admit(const std::string& target, const common::CancellationToken& cancel) {
    auto waitStart = steady_clock::now();

    if (!acquireSlot(cancel)) {
        LOG_DEBUG("Admission cancelled while waiting for a concurrency slot: " + target);
        return Permit();
    }

    milliseconds required{0};
    steady_clock::time_point plannedStart;
    steady_clock::time_point previousRequest;
    bool previouslyRequested = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& state = getOrCreateTargetState(target);
        auto now = steady_clock::now();

        double jitterMs = 0.0;
        if (!state.coolingDown && config_.jitter.count() > 0) {
            auto j = static_cast<double>(config_.jitter.count());
            jitterMs = uniform(-j, j);
        }
        required = remainingDelay(state, now, jitterMs);

        // Spacing is measured between starts, so the planned start is reserved now
        previousRequest = state.lastRequest;
        previouslyRequested = state.hasRequested;
        plannedStart = now + required;
        state.lastRequest = plannedStart;
        state.hasRequested = true;
        state.lastUsed = now;
        state.inFlight++;
    }

    if (required.count() > 0) {
        LOG_DEBUG("Target " + target + " requires delay of " + std::to_string(required.count()) + "ms");
        if (!cancel.sleepFor(required)) {
            LOG_DEBUG("Admission cancelled during spacing delay: " + target);
            {
                // Give the reservation back unless a later admission was spaced after it
                std::lock_guard<std::mutex> lock(mutex_);
                auto& state = getOrCreateTargetState(target);
                if (state.lastRequest == plannedStart) {
                    state.lastRequest = previousRequest;
                    state.hasRequested = previouslyRequested;
                }
            }
            releaseSlot(target);
            return Permit();
        }
    }

    auto waited = duration_cast<milliseconds>(steady_clock::now() - waitStart);
    return Permit(this, target, waited);
}

void RateController::report(const std::string& target, FetchOutcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& state = getOrCreateTargetState(target);
    auto now = steady_clock::now();
    state.lastUsed = now;

    if (outcome == FetchOutcome::SUCCESS) {
        if (state.consecutiveErrors > 0) {
            LOG_INFO("Target " + target + " recovered after " + std::to_string(state.consecutiveErrors) +
                     " consecutive failures, delay reset to " + std::to_string(state.baseDelay.count()) + "ms");
        }
        state.consecutiveErrors = 0;
        state.currentDelay = state.baseDelay;
        state.coolingDown = false;
        return;
    }

    state.consecutiveErrors++;
    state.lastFailure = now;
    state.hasFailure = true;

    if (state.consecutiveErrors >= config_.coolDownThreshold) {
        state.currentDelay = std::max(state.currentDelay, config_.coolDownDelay);
        if (!state.coolingDown) {
            LOG_ERROR("Target " + target + " has " + std::to_string(state.consecutiveErrors) +
                      " consecutive failures. Cooling down for " +
                      std::to_string(duration_cast<std::chrono::seconds>(state.currentDelay).count()) + "s");
        }
        state.coolingDown = true;
    } else if (state.consecutiveErrors >= config_.backoffThreshold) {
        // never shrink while failures keep coming
        state.currentDelay = std::max(state.currentDelay, calculateBackoffDelay(state));
        LOG_WARNING("Target " + target + " has " + std::to_string(state.consecutiveErrors) +
                    " consecutive failures. Backoff delay set to " + std::to_string(state.currentDelay.count()) + "ms");
    } else {
        LOG_DEBUG("Recorded failure for target: " + target +
                  " (consecutive failures: " + std::to_string(state.consecutiveErrors) + ")");
    }
}

milliseconds RateController::getDelay(const std::string& target) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = targets_.find(target);
    if (it == targets_.end()) {
        return milliseconds(0);
    }
    return remainingDelay(it->second, steady_clock::now(), 0.0);
}

TargetState RateController::getTargetState(const std::string& target) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = targets_.find(target);
    if (it != targets_.end()) {
        return it->second;
    }
    return makeTargetState(target);
}

size_t RateController::inFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inFlight_;
}

size_t RateController::trackedTargets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return targets_.size();
}

void RateController::setRandomSeed(uint32_t seed) {
    std::lock_guard<std::mutex> lock(mutex_);
    rng_.seed(seed);
}

bool RateController::acquireSlot(const common::CancellationToken& cancel) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (inFlight_ >= config_.concurrency) {
        if (cancel.isCancelled()) {
            return false;
        }
        slotAvailable_.wait_for(lock, kSlotPollInterval);
    }
    if (cancel.isCancelled()) {
        return false;
    }
    inFlight_++;
    return true;
}

void RateController::releaseSlot(const std::string& target) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (inFlight_ > 0) {
            inFlight_--;
        }
        auto it = targets_.find(target);
        if (it != targets_.end() && it->second.inFlight > 0) {
            it->second.inFlight--;
        }
    }
    slotAvailable_.notify_one();
}

TargetState& RateController::getOrCreateTargetState(const std::string& target) {
    auto it = targets_.find(target);
    if (it != targets_.end()) {
        return it->second;
    }
    if (targets_.size() >= config_.maxTrackedTargets) {
        evictIdleTargets();
    }
    LOG_DEBUG("Created new target state for: " + target);
    return targets_.emplace(target, makeTargetState(target)).first->second;
}

TargetState RateController::makeTargetState(const std::string& target) const {
    TargetState state;
    state.identity = target;
    state.baseDelay = baseDelayFor(target);
    state.currentDelay = state.baseDelay;
    return state;
}

milliseconds RateController::baseDelayFor(const std::string& target) const {
    auto it = config_.perTargetOverrides.find(target);
    if (it != config_.perTargetOverrides.end()) {
        return it->second;
    }
    return config_.baseDelay;
}

milliseconds RateController::calculateBackoffDelay(const TargetState& state) {
    // A zero base delay still backs off in whole seconds
    double unit = state.baseDelay.count() > 0 ? static_cast<double>(state.baseDelay.count()) : 1000.0;
    int exponent = std::min(state.consecutiveErrors - (config_.backoffThreshold - 1), 30);
    double delayMs = unit * std::pow(2.0, exponent) * uniform(0.8, 1.2);
    delayMs = std::min(delayMs, static_cast<double>(config_.maxBackoffDelay.count()));
    return milliseconds(static_cast<long long>(delayMs));
}

milliseconds RateController::remainingDelay(const TargetState& state,
                                            steady_clock::time_point now,
                                            double jitterMs) const {
    if (!state.hasRequested && !state.hasFailure) {
        return milliseconds(0);
    }

    // Backoff counts from whichever came last: the previous start or the failure report
    steady_clock::time_point anchor;
    if (state.hasRequested && state.hasFailure) {
        anchor = std::max(state.lastRequest, state.lastFailure);
    } else {
        anchor = state.hasRequested ? state.lastRequest : state.lastFailure;
    }

    double elapsedMs = static_cast<double>(duration_cast<milliseconds>(now - anchor).count());
    double required = static_cast<double>(state.currentDelay.count()) + jitterMs - elapsedMs;
    if (required <= 0) {
        return milliseconds(0);
    }
    return milliseconds(static_cast<long long>(std::ceil(required)));
}

double RateController::uniform(double lo, double hi) {
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(rng_);
}

void RateController::evictIdleTargets() {
    // Oldest idle targets first; targets in backoff or with permits out are kept
    std::vector<std::pair<steady_clock::time_point, std::string>> idle;
    for (const auto& [identity, state] : targets_) {
        if (state.inFlight == 0 && state.consecutiveErrors == 0) {
            idle.emplace_back(state.lastUsed, identity);
        }
    }
    std::sort(idle.begin(), idle.end());

    size_t toEvict = targets_.size() >= config_.maxTrackedTargets
                         ? targets_.size() - config_.maxTrackedTargets + 1
                         : 0;
    toEvict = std::min(toEvict, idle.size());
    for (size_t i = 0; i < toEvict; ++i) {
        targets_.erase(idle[i].second);
    }
    if (toEvict > 0) {
        LOG_DEBUG("Evicted " + std::to_string(toEvict) + " idle target states");
    }
}

} // namespace scrape_core::crawler
