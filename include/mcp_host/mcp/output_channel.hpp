#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

namespace mcp_host {

// ---------------------------------------------------------------------------
// OutputChannel — the single writer of the protocol stream.
//
// Responses and notifications from any thread are queued with Send() and
// written by one writer thread, one whole line each, in the order received.
// The writer never logs: a log record may itself become a notification on
// this channel.
// ---------------------------------------------------------------------------
class OutputChannel {
public:
    explicit OutputChannel(std::ostream& out);
    ~OutputChannel();

    OutputChannel(const OutputChannel&) = delete;
    OutputChannel& operator=(const OutputChannel&) = delete;

    /// Queues one message. Dropped after Close().
    void Send(const nlohmann::json& message);

    /// Blocks until everything queued so far has been written.
    void Flush();

    /// Writes what is queued, then stops the writer. Idempotent.
    void Close();

    [[nodiscard]] bool IsClosed() const;

private:
    void WriterLoop();

    std::ostream& out_;
    mutable std::mutex mutex_;
    std::condition_variable queued_cv_;
    std::condition_variable drained_cv_;
    std::deque<std::string> queue_;
    bool writing_ = false;
    bool closed_ = false;
    std::thread writer_;
};

} // namespace mcp_host
