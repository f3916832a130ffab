#pragma once

#include <mcp_host/core/clock.hpp>

#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace mcp_host {

struct RateLimitSettings {
    bool enabled = true;
    int default_limit_per_minute = 60;
    std::map<std::string, int> tool_limits;  // 0 = unlimited
};

// Admission gate consulted once per tool call, keyed by tool name.
class IRateLimiter {
public:
    virtual ~IRateLimiter() = default;

    /// True when the call may proceed. An admitted call is counted.
    virtual bool Admit(const std::string& key) = 0;
};

class NullRateLimiter : public IRateLimiter {
public:
    bool Admit(const std::string&) override { return true; }
};

// ---------------------------------------------------------------------------
// SlidingWindowRateLimiter — per-key sliding 60 second window.
//
// Keys are case-insensitive. The bucket map is guarded by a shared mutex and
// each bucket by its own mutex, so checks on different keys never wait on
// each other once their buckets exist.
// ---------------------------------------------------------------------------
class SlidingWindowRateLimiter : public IRateLimiter {
public:
    static constexpr std::chrono::seconds kWindow{60};

    explicit SlidingWindowRateLimiter(RateLimitSettings settings,
                                      NowFn now = SteadyNow());

    bool Admit(const std::string& key) override;

    /// Limit applied to `key`; 0 means unlimited.
    [[nodiscard]] int LimitFor(const std::string& key) const;

    /// Admissions currently counted in the window for `key`.
    [[nodiscard]] std::size_t CountInWindow(const std::string& key) const;

private:
    struct Bucket {
        std::mutex mutex;
        std::deque<TimePoint> admissions;
    };

    Bucket& BucketFor(const std::string& normalized_key);

    RateLimitSettings settings_;
    std::map<std::string, int> limits_;  // lower-cased tool name -> limit
    NowFn now_;
    mutable std::shared_mutex buckets_mutex_;
    std::unordered_map<std::string, std::unique_ptr<Bucket>> buckets_;
};

} // namespace mcp_host
