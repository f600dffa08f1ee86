#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace scrape_core::common {

/**
 * Shared cancellation flag passed into every blocking wait of the fetch layer.
 * Copies share state: cancelling one copy wakes every waiter on any copy.
 */
class CancellationToken {
public:
    CancellationToken();

    void cancel();
    bool isCancelled() const;

    /**
     * Sleep for the given duration unless cancelled first.
     * @return true if the full duration elapsed, false if cancelled
     */
    bool sleepFor(std::chrono::milliseconds duration) const;

private:
    struct State {
        mutable std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;
    };

    std::shared_ptr<State> state_;
};

} // namespace scrape_core::common
