#include <mcp_host/pipeline/rate_limiter.hpp>

#include <mcp_host/core/strings.hpp>

namespace mcp_host {

SlidingWindowRateLimiter::SlidingWindowRateLimiter(RateLimitSettings settings,
                                                   NowFn now)
    : settings_(std::move(settings)), now_(std::move(now)) {
    for (const auto& [tool, limit] : settings_.tool_limits) {
        limits_[ToLower(tool)] = limit;
    }
}

int SlidingWindowRateLimiter::LimitFor(const std::string& key) const {
    auto it = limits_.find(ToLower(key));
    if (it != limits_.end()) {
        return it->second;
    }
    return settings_.default_limit_per_minute;
}

SlidingWindowRateLimiter::Bucket& SlidingWindowRateLimiter::BucketFor(
    const std::string& normalized_key) {
    {
        std::shared_lock<std::shared_mutex> read_lock(buckets_mutex_);
        auto it = buckets_.find(normalized_key);
        if (it != buckets_.end()) {
            return *it->second;
        }
    }
    std::unique_lock<std::shared_mutex> write_lock(buckets_mutex_);
    auto& slot = buckets_[normalized_key];
    if (!slot) {
        slot = std::make_unique<Bucket>();
    }
    return *slot;
}

bool SlidingWindowRateLimiter::Admit(const std::string& key) {
    const int limit = LimitFor(key);
    if (limit <= 0) {
        return true;
    }

    auto& bucket = BucketFor(ToLower(key));
    std::lock_guard<std::mutex> lock(bucket.mutex);

    const auto now = now_();
    const auto window_start = now - kWindow;
    while (!bucket.admissions.empty() && bucket.admissions.front() <= window_start) {
        bucket.admissions.pop_front();
    }

    if (bucket.admissions.size() >= static_cast<std::size_t>(limit)) {
        return false;
    }
    bucket.admissions.push_back(now);
    return true;
}

std::size_t SlidingWindowRateLimiter::CountInWindow(const std::string& key) const {
    const auto normalized = ToLower(key);
    std::shared_lock<std::shared_mutex> read_lock(buckets_mutex_);
    auto it = buckets_.find(normalized);
    if (it == buckets_.end()) {
        return 0;
    }
    auto& bucket = *it->second;
    std::lock_guard<std::mutex> lock(bucket.mutex);
    const auto window_start = now_() - kWindow;
    std::size_t count = 0;
    for (const auto& at : bucket.admissions) {
        if (at > window_start) {
            ++count;
        }
    }
    return count;
}

} // namespace mcp_host
