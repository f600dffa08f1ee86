#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>
#include "models/FetchConfig.h"
#include "../common/CancellationToken.h"

namespace scrape_core::crawler {

enum class FetchOutcome {
    SUCCESS,
    FAILURE
};

// Pacing and backoff bookkeeping for one network authority
struct TargetState {
    std::string identity;

    // Planned start of the most recent admitted request
    std::chrono::steady_clock::time_point lastRequest{};
    std::chrono::steady_clock::time_point lastFailure{};
    bool hasRequested = false;
    bool hasFailure = false;

    int consecutiveErrors = 0;
    std::chrono::milliseconds baseDelay{0};
    std::chrono::milliseconds currentDelay{0};
    bool coolingDown = false;

    // Admitted permits for this target that have not been released yet
    size_t inFlight = 0;
    std::chrono::steady_clock::time_point lastUsed{};
};

class RateController;

/**
 * Admission ticket returned by RateController::admit. Holds one slot of the
 * global concurrency limiter until released or destroyed. Move-only; the slot
 * is given back exactly once.
 */
class Permit {
public:
    Permit() = default;
    ~Permit();

    Permit(Permit&& other) noexcept;
    Permit& operator=(Permit&& other) noexcept;
    Permit(const Permit&) = delete;
    Permit& operator=(const Permit&) = delete;

    bool granted() const { return owner_ != nullptr; }
    explicit operator bool() const { return granted(); }

    const std::string& target() const { return target_; }
    std::chrono::milliseconds waited() const { return waited_; }

    void release();

private:
    friend class RateController;
    Permit(RateController* owner, std::string target, std::chrono::milliseconds waited);

    RateController* owner_ = nullptr;
    std::string target_;
    std::chrono::milliseconds waited_{0};
};

class RateController {
public:
    explicit RateController(const RateLimitConfig& config = RateLimitConfig{});
    ~RateController();

    RateController(const RateController&) = delete;
    RateController& operator=(const RateController&) = delete;

    /**
     * Wait for a concurrency slot, then for the target's spacing delay.
     * @param target Authority identity (see common::targetOf)
     * @param cancel Token checked while waiting
     * @return A granted permit, or a non-granted one if cancelled while waiting
     */
    Permit admit(const std::string& target, const common::CancellationToken& cancel = common::CancellationToken());

    /**
     * Feed a request outcome back into the target's backoff state.
     * Failures escalate the delay; a success restores the base delay.
     */
    void report(const std::string& target, FetchOutcome outcome);

    /**
     * Remaining wait the next admission to this target would face, without jitter
     * @return 0 for unknown targets
     */
    std::chrono::milliseconds getDelay(const std::string& target) const;

    // Snapshot of a target's state; unknown targets yield a fresh default state
    TargetState getTargetState(const std::string& target) const;

    size_t inFlight() const;
    size_t trackedTargets() const;
    const RateLimitConfig& config() const { return config_; }

    // Deterministic jitter and backoff randomization for tests
    void setRandomSeed(uint32_t seed);

private:
    friend class Permit;

    bool acquireSlot(const common::CancellationToken& cancel);
    void releaseSlot(const std::string& target);

    TargetState& getOrCreateTargetState(const std::string& target);
    TargetState makeTargetState(const std::string& target) const;
    std::chrono::milliseconds baseDelayFor(const std::string& target) const;
    std::chrono::milliseconds calculateBackoffDelay(const TargetState& state);
    std::chrono::milliseconds remainingDelay(const TargetState& state,
                                             std::chrono::steady_clock::time_point now,
                                             double jitterMs) const;
    double uniform(double lo, double hi);
    void evictIdleTargets();

    RateLimitConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable slotAvailable_;
    size_t inFlight_ = 0;
    std::unordered_map<std::string, TargetState> targets_;
    std::mt19937 rng_;
};

} // namespace scrape_core::crawler
