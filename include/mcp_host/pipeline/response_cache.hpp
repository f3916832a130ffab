#pragma once

#include <mcp_host/core/clock.hpp>
#include <mcp_host/plugin/tool_result.hpp>

#include <chrono>
#include <list>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace mcp_host {

struct CacheSettings {
    bool enabled = true;
    int default_ttl_seconds = 300;
    int max_entries = 1000;
    std::map<std::string, int> tool_ttls;  // 0 = never cache this tool
};

/// "<lower(tool)>:<action>:<canonical args>" where canonical args is the
/// compact sorted-key dump of `arguments` without "action" and "_meta".
std::string BuildCacheKey(const std::string& tool_name,
                          const std::optional<std::string>& action,
                          const nlohmann::json& arguments);

/// The "action" argument: its string value, the compact dump of any other
/// non-null value, or nullopt when absent or null.
std::optional<std::string> ExtractAction(const nlohmann::json& arguments);

// Store of successful tool results keyed by BuildCacheKey().
class IResponseCache {
public:
    virtual ~IResponseCache() = default;

    virtual std::optional<ToolCallResult> Get(const std::string& key) = 0;

    /// A ttl of zero stores nothing.
    virtual void Put(const std::string& key, const ToolCallResult& value,
                     std::chrono::seconds ttl) = 0;

    [[nodiscard]] virtual std::chrono::seconds TtlFor(
        const std::string& tool_name) const = 0;
};

class NullResponseCache : public IResponseCache {
public:
    std::optional<ToolCallResult> Get(const std::string&) override {
        return std::nullopt;
    }
    void Put(const std::string&, const ToolCallResult&,
             std::chrono::seconds) override {}
    [[nodiscard]] std::chrono::seconds TtlFor(const std::string&) const override {
        return std::chrono::seconds{0};
    }
};

// ---------------------------------------------------------------------------
// MemoryResponseCache — bounded in-memory TTL cache.
//
// At capacity, expired entries are evicted first, then the oldest inserted.
// Expired entries are also dropped lazily when read. One mutex guards all
// state and is never held across anything that blocks.
// ---------------------------------------------------------------------------
class MemoryResponseCache : public IResponseCache {
public:
    explicit MemoryResponseCache(CacheSettings settings, NowFn now = SteadyNow());

    std::optional<ToolCallResult> Get(const std::string& key) override;
    void Put(const std::string& key, const ToolCallResult& value,
             std::chrono::seconds ttl) override;
    [[nodiscard]] std::chrono::seconds TtlFor(const std::string& tool_name) const override;

    [[nodiscard]] std::size_t Size() const;

private:
    struct Entry {
        ToolCallResult value;
        TimePoint expires_at;
        std::list<std::string>::iterator order;
    };

    void EvictExpiredLocked(TimePoint now);
    void EraseLocked(std::unordered_map<std::string, Entry>::iterator it);

    CacheSettings settings_;
    std::map<std::string, int> ttls_;  // lower-cased tool name -> seconds
    NowFn now_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::list<std::string> insertion_order_;  // oldest first
};

} // namespace mcp_host
