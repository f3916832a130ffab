#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace mcp_host {

struct AuditSettings {
    bool enabled = true;
    std::string directory = "audit";
    int retention_days = 30;  // 0 = keep forever
};

enum class AuditOutcome {
    Success,
    Failure,
    Timeout,
    RateLimited,
    Unauthorized,
    CacheHit,
};

const char* AuditOutcomeName(AuditOutcome outcome);

// One record per tool call attempt, including short-circuited ones.
struct AuditRecord {
    std::chrono::system_clock::time_point timestamp;
    std::string correlation_id;
    std::string tool_name;
    std::optional<std::string> action;
    std::optional<std::string> identity;
    nlohmann::json arguments;  // sanitized before it is persisted
    AuditOutcome outcome = AuditOutcome::Success;
    std::optional<std::string> error;
    long long duration_ms = 0;
};

nlohmann::json ToJson(const AuditRecord& record);

/// Replaces the value of every sensitive key (case-insensitive) with
/// "[REDACTED]", recursing through nested objects and arrays.
nlohmann::json SanitizeArguments(const nlohmann::json& arguments);

/// True for argument names whose values must never reach the audit trail.
bool IsSensitiveKey(std::string_view key);

/// "2025-01-31T12:34:56.789Z".
std::string FormatUtcTimestamp(std::chrono::system_clock::time_point tp);

class IAuditLogger {
public:
    virtual ~IAuditLogger() = default;

    /// Persists one record. Failures are logged, never thrown.
    virtual void Record(const AuditRecord& record) noexcept = 0;
};

class NullAuditLogger : public IAuditLogger {
public:
    void Record(const AuditRecord&) noexcept override {}
};

// ---------------------------------------------------------------------------
// FileAuditLogger — JSON lines in <dir>/audit-YYYY-MM-DD.jsonl (UTC date of
// each record). The first write of the process purges files older than the
// retention window. One mutex serializes writes so lines never interleave.
// ---------------------------------------------------------------------------
class FileAuditLogger : public IAuditLogger {
public:
    FileAuditLogger(std::filesystem::path directory, int retention_days);

    void Record(const AuditRecord& record) noexcept override;

    /// Deletes audit files dated before today minus the retention window.
    /// Returns the number of files removed.
    std::size_t PurgeExpired(std::chrono::system_clock::time_point now);

    [[nodiscard]] std::filesystem::path FileFor(
        std::chrono::system_clock::time_point timestamp) const;

private:
    void Append(const AuditRecord& record);

    std::filesystem::path directory_;
    int retention_days_;
    std::mutex mutex_;
    bool purged_ = false;
    std::filesystem::path current_path_;
    std::ofstream current_;
};

} // namespace mcp_host
