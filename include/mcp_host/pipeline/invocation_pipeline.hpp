#pragma once

#include <mcp_host/mcp/tool_registry.hpp>
#include <mcp_host/pipeline/audit_logger.hpp>
#include <mcp_host/pipeline/authorization.hpp>
#include <mcp_host/pipeline/rate_limiter.hpp>
#include <mcp_host/pipeline/response_cache.hpp>
#include <mcp_host/plugin/cancellation.hpp>
#include <mcp_host/plugin/progress.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_host {

struct ExecutionSettings {
    int timeout_seconds = 0;          // 0 = no per-call deadline
    int shutdown_grace_seconds = 5;
    int max_concurrent_calls = 4;
};

// Everything the pipeline needs to know about one call.
struct InvocationRequest {
    std::string tool_name;
    nlohmann::json arguments = nlohmann::json::object();
    std::optional<Identity> identity;
    std::shared_ptr<IProgressReporter> progress;  // null = no progress token
};

// What happened to one call, alongside the caller-visible result.
struct InvocationOutcome {
    ToolCallResult result;
    AuditOutcome outcome = AuditOutcome::Success;
    std::string correlation_id;
};

/// 32 lower-case hex characters.
std::string NewCorrelationId();

// ---------------------------------------------------------------------------
// InvocationPipeline — runs one tool call through authorization, rate
// admission and the response cache, executes it on a miss, then updates the
// cache and writes exactly one audit record.
//
// Invoke() never throws for tool faults: exceptions from tool code become a
// generic error result, and cache or audit failures are logged without
// changing the result. Safe to call from several threads at once.
// ---------------------------------------------------------------------------
class InvocationPipeline {
public:
    InvocationPipeline(const ToolRegistry& registry,
                       const IAuthorizationService& authorization,
                       IRateLimiter& rate_limiter,
                       IResponseCache& cache,
                       IAuditLogger& audit,
                       ExecutionSettings settings);

    InvocationPipeline(const InvocationPipeline&) = delete;
    InvocationPipeline& operator=(const InvocationPipeline&) = delete;

    [[nodiscard]] std::optional<Identity> ResolveIdentity(
        const std::optional<std::string>& credential) const;

    [[nodiscard]] InvocationOutcome Invoke(const InvocationRequest& request);

    /// Cancels every in-flight call and starts their grace period. Calls
    /// arriving afterwards are refused without executing.
    void Shutdown();

    [[nodiscard]] bool IsShuttingDown() const noexcept;

private:
    struct ExecutionResult {
        ToolCallResult result;
        AuditOutcome outcome = AuditOutcome::Success;
        std::optional<std::string> error;
        bool cacheable = false;
    };

    ExecutionResult Execute(const std::shared_ptr<ITool>& tool,
                            const InvocationRequest& request);

    void Audit(const InvocationRequest& request,
               const std::optional<std::string>& action,
               const std::string& correlation_id, AuditOutcome outcome,
               const std::optional<std::string>& error,
               std::chrono::steady_clock::time_point started) noexcept;

    std::optional<ToolCallResult> CacheGet(const std::string& key) noexcept;
    void CachePut(const std::string& key, const std::string& tool_name,
                  const ToolCallResult& result) noexcept;

    const ToolRegistry& registry_;
    const IAuthorizationService& authorization_;
    IRateLimiter& rate_limiter_;
    IResponseCache& cache_;
    IAuditLogger& audit_;
    ExecutionSettings settings_;
    CancellationSource shutdown_;
};

} // namespace mcp_host
