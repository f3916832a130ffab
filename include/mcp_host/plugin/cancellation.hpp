#pragma once

#include <chrono>
#include <memory>

namespace mcp_host {

// ---------------------------------------------------------------------------
// CancellationToken — read side of a cancellation signal handed to tools.
//
// Cancellation is advisory: a tool should poll IsCancelled() or block on
// WaitFor() between units of work and return early. A default-constructed
// token is never cancelled.
// ---------------------------------------------------------------------------
class CancellationToken {
public:
    CancellationToken() = default;

    [[nodiscard]] bool IsCancelled() const noexcept;

    /// Blocks until cancelled or until timeout elapses. Returns IsCancelled().
    bool WaitFor(std::chrono::milliseconds timeout) const;

    struct State;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<State> state)
        : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

// ---------------------------------------------------------------------------
// CancellationSource — write side; one per tool call, plus one for host
// shutdown owned by the invocation pipeline.
// ---------------------------------------------------------------------------
class CancellationSource {
public:
    CancellationSource();

    void Cancel();
    [[nodiscard]] bool IsCancelled() const noexcept;
    [[nodiscard]] CancellationToken Token() const;

private:
    std::shared_ptr<CancellationToken::State> state_;
};

} // namespace mcp_host
