#pragma once

#include <chrono>
#include <functional>

namespace mcp_host {

// Monotonic time source used by the rate limiter and the response cache.
// Tests inject a controllable function; production uses steady_clock.
using TimePoint = std::chrono::steady_clock::time_point;
using NowFn = std::function<TimePoint()>;

inline NowFn SteadyNow() {
    return [] { return std::chrono::steady_clock::now(); };
}

} // namespace mcp_host
