#include <mcp_host/plugin/cancellation.hpp>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace mcp_host {

struct CancellationToken::State {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::condition_variable cv;
};

bool CancellationToken::IsCancelled() const noexcept {
    return state_ && state_->cancelled.load();
}

bool CancellationToken::WaitFor(std::chrono::milliseconds timeout) const {
    if (!state_) {
        std::this_thread::sleep_for(timeout);
        return false;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout,
                               [this] { return state_->cancelled.load(); });
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<CancellationToken::State>()) {}

void CancellationSource::Cancel() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled.store(true);
    }
    state_->cv.notify_all();
}

bool CancellationSource::IsCancelled() const noexcept {
    return state_->cancelled.load();
}

CancellationToken CancellationSource::Token() const {
    return CancellationToken(state_);
}

} // namespace mcp_host
