#include <mcp_host/pipeline/invocation_pipeline.hpp>

#include <mcp_host/core/log.hpp>

#include <condition_variable>
#include <cstdio>
#include <exception>
#include <mutex>
#include <random>
#include <thread>

namespace mcp_host {

namespace {

constexpr const char* kComponent = "pipeline";
constexpr auto kPollInterval = std::chrono::milliseconds(50);

// Shared between the waiting caller and the (possibly abandoned) worker.
struct CallState {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    ToolCallResult result;
    std::optional<std::string> fault;
};

// Forwards progress until closed. An abandoned call keeps running on its
// detached thread; closing the gate drops the caller's reporter so nothing
// more is sent for a token whose response has already gone out.
class ProgressGate : public IProgressReporter {
public:
    explicit ProgressGate(std::shared_ptr<IProgressReporter> inner)
        : inner_(std::move(inner)) {}

    void Report(double progress, std::optional<double> total) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (inner_) {
            inner_->Report(progress, total);
        }
    }

    void Close() {
        std::lock_guard<std::mutex> lock(mutex_);
        inner_.reset();
    }

private:
    std::mutex mutex_;
    std::shared_ptr<IProgressReporter> inner_;
};

long long ElapsedMs(std::chrono::steady_clock::time_point started) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - started)
        .count();
}

} // anonymous namespace

std::string NewCorrelationId() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    char buf[33];
    std::snprintf(buf, sizeof(buf), "%016llx%016llx",
                  static_cast<unsigned long long>(engine()),
                  static_cast<unsigned long long>(engine()));
    return buf;
}

InvocationPipeline::InvocationPipeline(const ToolRegistry& registry,
                                       const IAuthorizationService& authorization,
                                       IRateLimiter& rate_limiter,
                                       IResponseCache& cache,
                                       IAuditLogger& audit,
                                       ExecutionSettings settings)
    : registry_(registry),
      authorization_(authorization),
      rate_limiter_(rate_limiter),
      cache_(cache),
      audit_(audit),
      settings_(settings) {}

std::optional<Identity> InvocationPipeline::ResolveIdentity(
    const std::optional<std::string>& credential) const {
    return authorization_.ResolveIdentity(credential);
}

void InvocationPipeline::Shutdown() {
    if (!shutdown_.IsCancelled()) {
        LogInfo(kComponent, "Shutdown requested; cancelling in-flight tool calls");
        shutdown_.Cancel();
    }
}

bool InvocationPipeline::IsShuttingDown() const noexcept {
    return shutdown_.IsCancelled();
}

// ---------------------------------------------------------------------------
// Invoke
// ---------------------------------------------------------------------------
InvocationOutcome InvocationPipeline::Invoke(const InvocationRequest& request) {
    const auto started = std::chrono::steady_clock::now();
    const auto correlation_id = NewCorrelationId();
    const auto action = ExtractAction(request.arguments);
    const auto& tool_name = request.tool_name;

    auto finish = [&](ToolCallResult result, AuditOutcome outcome,
                      const std::optional<std::string>& error) {
        Audit(request, action, correlation_id, outcome, error, started);
        return InvocationOutcome{std::move(result), outcome, correlation_id};
    };

    // 1. Authorization. Denial must not consume a rate token.
    auto decision = authorization_.Authorize(request.identity, tool_name, action);
    if (!decision.allowed) {
        auto reason = decision.reason.value_or("Unauthorized");
        LogWarn(kComponent, "Denied call to '" + tool_name + "': " + reason);
        return finish(ToolCallResult::Failure(reason), AuditOutcome::Unauthorized, reason);
    }

    // 2. Rate admission. Denial must not touch the cache.
    if (!rate_limiter_.Admit(tool_name)) {
        LogWarn(kComponent, "Rate limit exceeded for tool '" + tool_name + "'");
        return finish(ToolCallResult::Failure("Rate limit exceeded for tool '" + tool_name +
                                              "'. Please wait a moment and try again."),
                      AuditOutcome::RateLimited, std::string("Rate limit exceeded"));
    }

    // 3. Cache probe.
    const auto cache_key = BuildCacheKey(tool_name, action, request.arguments);
    if (auto cached = CacheGet(cache_key)) {
        LogDebug(kComponent, "Cache hit for '" + tool_name + "'");
        return finish(std::move(*cached), AuditOutcome::CacheHit, std::nullopt);
    }

    // 4. Execute.
    auto tool = registry_.Find(tool_name);
    if (!tool) {
        return finish(ToolCallResult::Failure("Unknown tool: " + tool_name),
                      AuditOutcome::Failure, "Unknown tool: " + tool_name);
    }
    if (IsShuttingDown()) {
        return finish(ToolCallResult::Failure("Server is shutting down; call to '" +
                                              tool_name + "' was not started."),
                      AuditOutcome::Failure, std::string("Server is shutting down"));
    }

    LogInfo(kComponent, "Tool call: " + tool_name + " [" + correlation_id + "]");
    auto executed = Execute(tool, request);

    // 5. Cache only clean, completed successes.
    if (executed.cacheable) {
        CachePut(cache_key, tool_name, executed.result);
    }
    return finish(std::move(executed.result), executed.outcome, executed.error);
}

// ---------------------------------------------------------------------------
// Execute — runs the tool on its own thread so a call that ignores its
// cancellation token can be abandoned after the grace period.
// ---------------------------------------------------------------------------
InvocationPipeline::ExecutionResult InvocationPipeline::Execute(
    const std::shared_ptr<ITool>& tool, const InvocationRequest& request) {
    auto state = std::make_shared<CallState>();
    CancellationSource call_source;
    auto progress = std::make_shared<ProgressGate>(request.progress);

    std::thread worker([tool, arguments = request.arguments, progress,
                        token = call_source.Token(), state]() {
        ToolCallResult result;
        std::optional<std::string> fault;
        try {
            result = tool->Execute(arguments, *progress, token);
        } catch (const std::exception& e) {
            fault = e.what();
        } catch (...) {
            fault = "non-standard exception";
        }
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->result = std::move(result);
            state->fault = std::move(fault);
            state->done = true;
        }
        state->cv.notify_all();
    });
    worker.detach();

    using Clock = std::chrono::steady_clock;
    const auto started = Clock::now();
    const auto deadline = settings_.timeout_seconds > 0
                              ? started + std::chrono::seconds(settings_.timeout_seconds)
                              : Clock::time_point::max();
    const auto grace = std::chrono::seconds(
        settings_.shutdown_grace_seconds > 0 ? settings_.shutdown_grace_seconds : 0);

    bool cancelled = false;
    Clock::time_point grace_deadline;
    std::string cancel_reason;

    std::unique_lock<std::mutex> lock(state->mutex);
    while (!state->done) {
        const auto now = Clock::now();
        if (!cancelled && (shutdown_.IsCancelled() || now >= deadline)) {
            cancel_reason = shutdown_.IsCancelled()
                                ? "cancelled by server shutdown"
                                : "timed out after " +
                                      std::to_string(settings_.timeout_seconds) + "s";
            call_source.Cancel();
            cancelled = true;
            grace_deadline = now + grace;
            LogWarn(kComponent, "Tool '" + request.tool_name + "' " + cancel_reason +
                                    "; waiting up to " + std::to_string(grace.count()) +
                                    "s for it to stop");
        }
        if (cancelled && now >= grace_deadline) {
            break;
        }
        state->cv.wait_for(lock, kPollInterval);
    }

    ExecutionResult out;
    if (!state->done) {
        lock.unlock();
        progress->Close();
        LogError(kComponent, "Tool '" + request.tool_name +
                                 "' did not stop within the grace period; abandoning it");
        out.result = ToolCallResult::Failure("Tool '" + request.tool_name +
                                             "' did not complete: " + cancel_reason + ".");
        out.outcome = AuditOutcome::Timeout;
        out.error = cancel_reason;
        return out;
    }

    if (state->fault) {
        LogError(kComponent, "Tool execution failed: " + request.tool_name + ": " +
                                 *state->fault);
        out.result = ToolCallResult::Failure("Error executing tool '" + request.tool_name +
                                             "': an unexpected error occurred.");
        out.outcome = AuditOutcome::Failure;
        out.error = *state->fault;
        return out;
    }

    out.result = std::move(state->result);
    if (out.result.is_error) {
        out.outcome = AuditOutcome::Failure;
        out.error = out.result.FirstText();
    } else {
        out.outcome = AuditOutcome::Success;
        out.cacheable = !cancelled;
    }
    return out;
}

// ---------------------------------------------------------------------------
// Boundaries around the auxiliary subsystems
// ---------------------------------------------------------------------------
void InvocationPipeline::Audit(const InvocationRequest& request,
                               const std::optional<std::string>& action,
                               const std::string& correlation_id,
                               AuditOutcome outcome,
                               const std::optional<std::string>& error,
                               std::chrono::steady_clock::time_point started) noexcept {
    try {
        AuditRecord record;
        record.timestamp = std::chrono::system_clock::now();
        record.correlation_id = correlation_id;
        record.tool_name = request.tool_name;
        record.action = action;
        if (request.identity) {
            record.identity = request.identity->name;
        }
        record.arguments = request.arguments;
        record.outcome = outcome;
        record.error = error;
        record.duration_ms = ElapsedMs(started);
        audit_.Record(record);
    } catch (const std::exception& e) {
        LogWarn(kComponent, "Audit write failed for tool '" + request.tool_name +
                                "'; call completed normally: " + e.what());
    }
}

std::optional<ToolCallResult> InvocationPipeline::CacheGet(const std::string& key) noexcept {
    try {
        return cache_.Get(key);
    } catch (const std::exception& e) {
        LogWarn(kComponent, std::string("Cache read failed; treating as miss: ") + e.what());
        return std::nullopt;
    }
}

void InvocationPipeline::CachePut(const std::string& key, const std::string& tool_name,
                                  const ToolCallResult& result) noexcept {
    try {
        cache_.Put(key, result, cache_.TtlFor(tool_name));
    } catch (const std::exception& e) {
        LogWarn(kComponent, "Cache write failed for tool '" + tool_name + "': " + e.what());
    }
}

} // namespace mcp_host
