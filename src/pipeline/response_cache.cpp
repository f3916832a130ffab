#include <mcp_host/pipeline/response_cache.hpp>

#include <mcp_host/core/strings.hpp>

namespace mcp_host {

// ---------------------------------------------------------------------------
// Cache keys
// ---------------------------------------------------------------------------
std::optional<std::string> ExtractAction(const nlohmann::json& arguments) {
    if (!arguments.is_object()) {
        return std::nullopt;
    }
    for (auto it = arguments.begin(); it != arguments.end(); ++it) {
        if (!EqualsIgnoreCase(it.key(), "action") || it.value().is_null()) {
            continue;
        }
        if (it.value().is_string()) {
            return it.value().get<std::string>();
        }
        return it.value().dump();
    }
    return std::nullopt;
}

std::string BuildCacheKey(const std::string& tool_name,
                          const std::optional<std::string>& action,
                          const nlohmann::json& arguments) {
    nlohmann::json canonical = nlohmann::json::object();
    if (arguments.is_object()) {
        for (auto it = arguments.begin(); it != arguments.end(); ++it) {
            if (EqualsIgnoreCase(it.key(), "action") ||
                EqualsIgnoreCase(it.key(), "_meta")) {
                continue;
            }
            canonical[it.key()] = it.value();
        }
    } else if (!arguments.is_null()) {
        canonical = arguments;
    }
    // nlohmann::json objects are std::map backed, so dump() is key-sorted.
    return ToLower(tool_name) + ":" + action.value_or("") + ":" + canonical.dump();
}

// ---------------------------------------------------------------------------
// MemoryResponseCache
// ---------------------------------------------------------------------------
MemoryResponseCache::MemoryResponseCache(CacheSettings settings, NowFn now)
    : settings_(std::move(settings)), now_(std::move(now)) {
    for (const auto& [tool, ttl] : settings_.tool_ttls) {
        ttls_[ToLower(tool)] = ttl;
    }
}

std::chrono::seconds MemoryResponseCache::TtlFor(const std::string& tool_name) const {
    auto it = ttls_.find(ToLower(tool_name));
    const int seconds = it != ttls_.end() ? it->second : settings_.default_ttl_seconds;
    return std::chrono::seconds{seconds > 0 ? seconds : 0};
}

std::optional<ToolCallResult> MemoryResponseCache::Get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (it->second.expires_at <= now_()) {
        EraseLocked(it);
        return std::nullopt;
    }
    return it->second.value;
}

void MemoryResponseCache::Put(const std::string& key, const ToolCallResult& value,
                              std::chrono::seconds ttl) {
    if (ttl.count() <= 0 || settings_.max_entries <= 0) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = now_();

    auto existing = entries_.find(key);
    if (existing != entries_.end()) {
        EraseLocked(existing);
    }

    const auto capacity = static_cast<std::size_t>(settings_.max_entries);
    if (entries_.size() >= capacity) {
        EvictExpiredLocked(now);
    }
    while (entries_.size() >= capacity && !insertion_order_.empty()) {
        EraseLocked(entries_.find(insertion_order_.front()));
    }

    auto order = insertion_order_.insert(insertion_order_.end(), key);
    entries_.emplace(key, Entry{value, now + ttl, order});
}

std::size_t MemoryResponseCache::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void MemoryResponseCache::EvictExpiredLocked(TimePoint now) {
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.expires_at <= now) {
            insertion_order_.erase(it->second.order);
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

void MemoryResponseCache::EraseLocked(
    std::unordered_map<std::string, Entry>::iterator it) {
    if (it == entries_.end()) {
        return;
    }
    insertion_order_.erase(it->second.order);
    entries_.erase(it);
}

} // namespace mcp_host
