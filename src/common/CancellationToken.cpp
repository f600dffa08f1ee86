#include "../../include/scrape_core/common/CancellationToken.h"

namespace scrape_core::common {

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled = true;
    }
    state_->cv.notify_all();
}

bool CancellationToken::isCancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

bool CancellationToken::sleepFor(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    if (duration.count() <= 0) {
        return !state_->cancelled;
    }
    bool cancelled = state_->cv.wait_for(lock, duration, [this] { return state_->cancelled; });
    return !cancelled;
}

} // namespace scrape_core::common
