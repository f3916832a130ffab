#include <mcp_host/mcp/output_channel.hpp>

namespace mcp_host {

OutputChannel::OutputChannel(std::ostream& out)
    : out_(out), writer_([this] { WriterLoop(); }) {}

OutputChannel::~OutputChannel() {
    Close();
}

void OutputChannel::Send(const nlohmann::json& message) {
    auto line = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        queue_.push_back(std::move(line));
    }
    queued_cv_.notify_one();
}

void OutputChannel::Flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    drained_cv_.wait(lock, [this] { return queue_.empty() && !writing_; });
}

void OutputChannel::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
    }
    queued_cv_.notify_one();
    if (writer_.joinable()) {
        writer_.join();
    }
    drained_cv_.notify_all();
}

bool OutputChannel::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

void OutputChannel::WriterLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        queued_cv_.wait(lock, [this] { return !queue_.empty() || closed_; });
        if (queue_.empty()) {
            break;  // closed and drained
        }
        auto line = std::move(queue_.front());
        queue_.pop_front();
        writing_ = true;
        lock.unlock();

        out_ << line << '\n';
        out_.flush();

        lock.lock();
        writing_ = false;
        if (queue_.empty()) {
            drained_cv_.notify_all();
        }
    }
    drained_cv_.notify_all();
}

} // namespace mcp_host
