#pragma once

#include <mcp_host/mcp/client_log_sink.hpp>
#include <mcp_host/mcp/output_channel.hpp>
#include <mcp_host/mcp/prompt_provider.hpp>
#include <mcp_host/mcp/resource_provider.hpp>
#include <mcp_host/mcp/session.hpp>
#include <mcp_host/mcp/tool_registry.hpp>
#include <mcp_host/pipeline/invocation_pipeline.hpp>

#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_host {

// JSON-RPC 2.0 and MCP error codes.
namespace rpc_error {
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
constexpr int kNotInitialized = -32002;
} // namespace rpc_error

/// Protocol versions this server speaks, oldest first.
const std::vector<std::string>& SupportedProtocolVersions();

/// The client's version when supported, otherwise the newest supported.
std::string NegotiateProtocolVersion(const std::string& requested);

// Collaborators built once in main() and shared with the server.
struct ServerContext {
    const ToolRegistry& registry;
    InvocationPipeline& pipeline;
    std::vector<std::shared_ptr<IResourceProvider>> resources;
    std::vector<std::shared_ptr<IPromptProvider>> prompts;
    std::shared_ptr<ClientLogSink> client_log;  // may be null
};

struct ServerOptions {
    std::string name = "mcp-host";
    std::string version;                     // empty = build version
    std::optional<std::string> credential;   // API key presented by this session
    int max_concurrent_calls = 4;
};

// ---------------------------------------------------------------------------
// McpServer — MCP server over newline-delimited JSON-RPC 2.0 on stdin/stdout.
//
// Session phases: Uninitialized --initialize--> Initializing
// --notifications/initialized--> Ready. Only initialize and ping are served
// before Ready.
//
// Methods:
//   - initialize, ping
//   - tools/list, tools/call
//   - resources/list, resources/read
//   - prompts/list, prompts/get
//   - logging/setLevel
//   - notifications/initialized (notification, no response)
//
// Every outbound line goes through the OutputChannel.
// ---------------------------------------------------------------------------
class McpServer {
public:
    McpServer(ServerContext context, ServerOptions options,
              std::istream& in = std::cin,
              std::ostream& out = std::cout);
    ~McpServer();

    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    // Run the server loop (blocks until EOF on the input stream). tools/call
    // runs on a worker pool; everything else is handled inline.
    void Run();

    // Process a single JSON-RPC message and return the response (if any).
    // Returns nullopt for notifications. Thread-safe.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

    [[nodiscard]] SessionPhase Phase() const;
    [[nodiscard]] Session SessionSnapshot() const;

    [[nodiscard]] const std::shared_ptr<OutputChannel>& Channel() const noexcept {
        return channel_;
    }

private:
    // HandleMessage() with unexpected exceptions mapped to an internal error.
    std::optional<nlohmann::json> SafeHandleMessage(const nlohmann::json& message);
    std::optional<nlohmann::json> HandleNotification(const std::string& method);

    nlohmann::json HandleInitialize(const nlohmann::json& params,
                                    const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id);
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id);
    nlohmann::json HandleResourcesList(const nlohmann::json& id);
    nlohmann::json HandleResourcesRead(const nlohmann::json& params,
                                       const nlohmann::json& id);
    nlohmann::json HandlePromptsList(const nlohmann::json& id);
    nlohmann::json HandlePromptsGet(const nlohmann::json& params,
                                    const nlohmann::json& id);
    nlohmann::json HandleSetLevel(const nlohmann::json& params,
                                  const nlohmann::json& id);

    bool IsToolCallReady(const nlohmann::json& message) const;

    static nlohmann::json MakeError(const nlohmann::json& id,
                                    int code, const std::string& message);
    static nlohmann::json MakeResult(const nlohmann::json& id,
                                     const nlohmann::json& result);

    ServerContext context_;
    ServerOptions options_;
    std::istream& in_;
    std::shared_ptr<OutputChannel> channel_;

    mutable std::mutex session_mutex_;
    Session session_;
};

} // namespace mcp_host
