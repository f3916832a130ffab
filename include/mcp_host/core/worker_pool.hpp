#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace mcp_host {

// ---------------------------------------------------------------------------
// WorkerPool — fixed number of threads draining a FIFO of tasks.
//
// Tasks must not throw; an escaping exception is logged and dropped so one
// bad task cannot take a worker down.
// ---------------------------------------------------------------------------
class WorkerPool {
public:
    explicit WorkerPool(int workers);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Returns false once Stop() has been called.
    bool Submit(std::function<void()> task);

    /// Runs every queued task to completion, then joins the workers.
    void Stop();

    [[nodiscard]] std::size_t Size() const noexcept { return threads_.size(); }

private:
    void WorkerLoop();

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> queue_;
    bool stopping_ = false;
    std::vector<std::thread> threads_;
};

} // namespace mcp_host
