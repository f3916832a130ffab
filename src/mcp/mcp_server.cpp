#include <mcp_host/mcp/mcp_server.hpp>

#include <mcp_host/core/log.hpp>
#include <mcp_host/core/version.hpp>
#include <mcp_host/core/worker_pool.hpp>
#include <mcp_host/mcp/progress_notifier.hpp>

#include <algorithm>
#include <exception>
#include <string>

namespace mcp_host {

namespace {

constexpr const char* kComponent = "mcp";

bool IsRequest(const nlohmann::json& message) {
    return message.contains("id");
}

bool IsValidId(const nlohmann::json& id) {
    return id.is_string() || id.is_number_integer() || id.is_null();
}

std::string StringField(const nlohmann::json& object, const char* key,
                        const std::string& fallback = "") {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

int ErrorCodeFor(const Error& error) {
    switch (error.category) {
        case ErrorCategory::NotFound:
        case ErrorCategory::AccessDenied:
        case ErrorCategory::InvalidArgument:
            return rpc_error::kInvalidParams;
        default:
            return rpc_error::kInternalError;
    }
}

} // anonymous namespace

const std::vector<std::string>& SupportedProtocolVersions() {
    static const std::vector<std::string> kVersions = {
        "2024-11-05", "2025-03-26", "2025-06-18",
    };
    return kVersions;
}

std::string NegotiateProtocolVersion(const std::string& requested) {
    const auto& supported = SupportedProtocolVersions();
    if (std::find(supported.begin(), supported.end(), requested) != supported.end()) {
        return requested;
    }
    return supported.back();
}

McpServer::McpServer(ServerContext context, ServerOptions options,
                     std::istream& in, std::ostream& out)
    : context_(std::move(context)),
      options_(std::move(options)),
      in_(in),
      channel_(std::make_shared<OutputChannel>(out)) {
    if (options_.version.empty()) {
        options_.version = kVersion;
    }
    if (context_.client_log) {
        context_.client_log->Attach(channel_);
    }
}

McpServer::~McpServer() {
    if (context_.client_log) {
        context_.client_log->Detach();
    }
    channel_->Close();
}

// ---------------------------------------------------------------------------
// Run
// ---------------------------------------------------------------------------
void McpServer::Run() {
    WorkerPool pool(options_.max_concurrent_calls);
    LogInfo(kComponent, "Serving on stdio with " + std::to_string(pool.Size()) +
                            " tool worker(s)");

    std::string line;
    while (std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) continue;

        nlohmann::json message;
        try {
            message = nlohmann::json::parse(line);
        } catch (const nlohmann::json::exception& e) {
            LogWarn(kComponent, std::string("Unparseable input line: ") + e.what());
            channel_->Send(MakeError(nullptr, rpc_error::kParseError, "Parse error"));
            continue;
        }

        if (IsToolCallReady(message)) {
            auto submitted = pool.Submit([this, message = std::move(message)] {
                if (auto response = SafeHandleMessage(message)) {
                    channel_->Send(*response);
                }
            });
            if (!submitted) {
                LogError(kComponent, "Worker pool rejected a tool call");
            }
            continue;
        }

        auto response = SafeHandleMessage(message);
        if (response) {
            channel_->Send(*response);
        }
    }

    LogInfo(kComponent, "Input closed; shutting down");
    context_.pipeline.Shutdown();
    pool.Stop();
    if (context_.client_log) {
        context_.client_log->Detach();
    }
    channel_->Close();
}

std::optional<nlohmann::json> McpServer::SafeHandleMessage(
    const nlohmann::json& message) {
    try {
        return HandleMessage(message);
    } catch (const std::exception& e) {
        LogError(kComponent, std::string("Internal error while handling message: ") + e.what());
        if (!message.is_object() || !message.contains("id")) {
            return std::nullopt;
        }
        const auto& id = message["id"];
        return MakeError(IsValidId(id) ? id : nlohmann::json(),
                         rpc_error::kInternalError, "Internal error");
    }
}

bool McpServer::IsToolCallReady(const nlohmann::json& message) const {
    if (!message.is_object() || !IsRequest(message) ||
        StringField(message, "jsonrpc") != "2.0" ||
        StringField(message, "method") != "tools/call") {
        return false;
    }
    return Phase() == SessionPhase::Ready;
}

SessionPhase McpServer::Phase() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_.phase;
}

Session McpServer::SessionSnapshot() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_;
}

// ---------------------------------------------------------------------------
// HandleMessage
// ---------------------------------------------------------------------------
std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) {
    if (!message.is_object()) {
        return MakeError(nullptr, rpc_error::kInvalidRequest,
                         "Invalid request: expected a JSON-RPC object");
    }

    const bool is_notification = !IsRequest(message);
    const nlohmann::json id = is_notification ? nlohmann::json() : message["id"];

    // Check for JSON-RPC 2.0.
    auto version = message.find("jsonrpc");
    if (version == message.end() || *version != "2.0") {
        if (is_notification) {
            return std::nullopt;
        }
        return MakeError(IsValidId(id) ? id : nlohmann::json(),
                         rpc_error::kInvalidRequest, "Invalid JSON-RPC version");
    }

    auto method_it = message.find("method");
    if (method_it == message.end() || !method_it->is_string()) {
        if (is_notification) {
            return std::nullopt;
        }
        return MakeError(IsValidId(id) ? id : nlohmann::json(),
                         rpc_error::kInvalidRequest, "Missing method");
    }
    const auto method = method_it->get<std::string>();

    if (is_notification) {
        return HandleNotification(method);
    }

    if (!IsValidId(id)) {
        return MakeError(nullptr, rpc_error::kInvalidRequest, "Invalid request id");
    }

    auto params = message.value("params", nlohmann::json::object());
    if (params.is_null()) {
        params = nlohmann::json::object();
    }
    if (!params.is_object()) {
        return MakeError(id, rpc_error::kInvalidParams, "params must be an object");
    }

    if (method == "initialize") {
        return HandleInitialize(params, id);
    }
    if (method == "ping") {
        return MakeResult(id, nlohmann::json::object());
    }

    if (Phase() != SessionPhase::Ready) {
        LogWarn(kComponent, "Rejected '" + method + "' before initialization completed");
        return MakeError(id, rpc_error::kNotInitialized,
                         "Server not initialized. Send 'initialize' request first.");
    }

    if (method == "tools/list") {
        return HandleToolsList(id);
    } else if (method == "tools/call") {
        return HandleToolsCall(params, id);
    } else if (method == "resources/list") {
        return HandleResourcesList(id);
    } else if (method == "resources/read") {
        return HandleResourcesRead(params, id);
    } else if (method == "prompts/list") {
        return HandlePromptsList(id);
    } else if (method == "prompts/get") {
        return HandlePromptsGet(params, id);
    } else if (method == "logging/setLevel") {
        return HandleSetLevel(params, id);
    } else {
        return MakeError(id, rpc_error::kMethodNotFound, "Method not found: " + method);
    }
}

std::optional<nlohmann::json> McpServer::HandleNotification(const std::string& method) {
    if (method == "notifications/initialized") {
        std::lock_guard<std::mutex> lock(session_mutex_);
        if (session_.phase == SessionPhase::Initializing) {
            session_.phase = SessionPhase::Ready;
            LogInfo(kComponent, "Client initialized; session ready");
        } else if (session_.phase == SessionPhase::Uninitialized) {
            LogWarn(kComponent, "Ignoring notifications/initialized received before initialize");
        }
        return std::nullopt;
    }
    LogDebug(kComponent, "Ignoring notification: " + method);
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Handshake
// ---------------------------------------------------------------------------
nlohmann::json McpServer::HandleInitialize(
    const nlohmann::json& params, const nlohmann::json& id) {
    const auto requested = StringField(params, "protocolVersion");
    const auto negotiated = NegotiateProtocolVersion(requested);

    ClientInfo client;
    auto client_info = params.find("clientInfo");
    if (client_info != params.end() && client_info->is_object()) {
        client.name = StringField(*client_info, "name", client.name);
        client.version = StringField(*client_info, "version", client.version);
    }

    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        if (session_.phase != SessionPhase::Uninitialized) {
            return MakeError(id, rpc_error::kInvalidRequest, "Server already initialized");
        }
        session_.phase = SessionPhase::Initializing;
        session_.protocol_version = negotiated;
        session_.client = client;
        session_.identity = context_.pipeline.ResolveIdentity(options_.credential);
    }

    LogInfo(kComponent, "Client: " + client.name + " " + client.version +
                            ", protocol " + negotiated);

    nlohmann::json result;
    result["protocolVersion"] = negotiated;
    result["capabilities"] = {
        {"tools", {{"listChanged", false}}},
        {"resources", {{"subscribe", false}, {"listChanged", false}}},
        {"prompts", {{"listChanged", false}}},
        {"logging", nlohmann::json::object()},
    };
    result["serverInfo"] = {
        {"name", options_.name},
        {"version", options_.version}
    };

    return MakeResult(id, result);
}

// ---------------------------------------------------------------------------
// Tools
// ---------------------------------------------------------------------------
nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id) {
    nlohmann::json tools = nlohmann::json::array();

    for (const auto& descriptor : context_.registry.Tools()) {
        tools.push_back({
            {"name", descriptor.name},
            {"description", descriptor.description},
            {"inputSchema", descriptor.input_schema}
        });
    }

    return MakeResult(id, {{"tools", tools}});
}

nlohmann::json McpServer::HandleToolsCall(
    const nlohmann::json& params, const nlohmann::json& id) {
    auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string() ||
        name_it->get<std::string>().empty()) {
        return MakeError(id, rpc_error::kInvalidParams, "Missing 'name' parameter");
    }

    InvocationRequest request;
    request.tool_name = name_it->get<std::string>();

    auto args_it = params.find("arguments");
    if (args_it != params.end() && !args_it->is_null()) {
        if (!args_it->is_object()) {
            return MakeError(id, rpc_error::kInvalidParams, "'arguments' must be an object");
        }
        request.arguments = *args_it;
    }

    if (!context_.registry.HasTool(request.tool_name)) {
        return MakeError(id, rpc_error::kInvalidParams, "Unknown tool: " + request.tool_name);
    }

    if (auto token = ExtractProgressToken(params)) {
        request.progress = std::make_shared<ProgressNotifier>(*token, channel_);
    }

    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        request.identity = session_.identity;
    }

    auto outcome = context_.pipeline.Invoke(request);
    return MakeResult(id, nlohmann::json(outcome.result));
}

// ---------------------------------------------------------------------------
// Resources
// ---------------------------------------------------------------------------
nlohmann::json McpServer::HandleResourcesList(const nlohmann::json& id) {
    nlohmann::json resources = nlohmann::json::array();
    for (const auto& provider : context_.resources) {
        try {
            for (const auto& resource : provider->ListResources()) {
                resources.push_back(nlohmann::json(resource));
            }
        } catch (const std::exception& e) {
            LogError(kComponent, std::string("Resource provider failed to list: ") + e.what());
        }
    }
    return MakeResult(id, {{"resources", resources}});
}

nlohmann::json McpServer::HandleResourcesRead(
    const nlohmann::json& params, const nlohmann::json& id) {
    auto uri_it = params.find("uri");
    if (uri_it == params.end() || !uri_it->is_string()) {
        return MakeError(id, rpc_error::kInvalidParams, "Missing 'uri' parameter");
    }
    const auto uri = uri_it->get<std::string>();

    auto provider = std::find_if(context_.resources.begin(), context_.resources.end(),
                                 [&](const auto& p) { return p->CanHandle(uri); });
    if (provider == context_.resources.end()) {
        return MakeError(id, rpc_error::kInvalidParams, "No resource provider for URI: " + uri);
    }

    auto contents = (*provider)->ReadResource(uri);
    if (contents.IsErr()) {
        const auto& error = contents.Error();
        LogWarn(kComponent, "resources/read failed: " + error.ToString());
        return MakeError(id, ErrorCodeFor(error), error.message);
    }
    nlohmann::json list = nlohmann::json::array();
    list.push_back(nlohmann::json(contents.Value()));
    return MakeResult(id, {{"contents", list}});
}

// ---------------------------------------------------------------------------
// Prompts
// ---------------------------------------------------------------------------
nlohmann::json McpServer::HandlePromptsList(const nlohmann::json& id) {
    nlohmann::json prompts = nlohmann::json::array();
    for (const auto& provider : context_.prompts) {
        for (const auto& prompt : provider->ListPrompts()) {
            prompts.push_back(nlohmann::json(prompt));
        }
    }
    return MakeResult(id, {{"prompts", prompts}});
}

nlohmann::json McpServer::HandlePromptsGet(
    const nlohmann::json& params, const nlohmann::json& id) {
    auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string()) {
        return MakeError(id, rpc_error::kInvalidParams, "Missing 'name' parameter");
    }
    const auto name = name_it->get<std::string>();

    PromptArguments arguments;
    auto args_it = params.find("arguments");
    if (args_it != params.end() && !args_it->is_null()) {
        if (!args_it->is_object()) {
            return MakeError(id, rpc_error::kInvalidParams, "'arguments' must be an object");
        }
        for (auto it = args_it->begin(); it != args_it->end(); ++it) {
            arguments[it.key()] = it.value().is_string() ? it.value().get<std::string>()
                                                         : it.value().dump();
        }
    }

    auto provider = std::find_if(context_.prompts.begin(), context_.prompts.end(),
                                 [&](const auto& p) { return p->CanHandle(name); });
    if (provider == context_.prompts.end()) {
        return MakeError(id, rpc_error::kInvalidParams, "Prompt not found: " + name);
    }

    auto prompt = (*provider)->GetPrompt(name, arguments);
    if (prompt.IsErr()) {
        return MakeError(id, ErrorCodeFor(prompt.Error()), prompt.Error().message);
    }
    return MakeResult(id, prompt.Value());
}

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------
nlohmann::json McpServer::HandleSetLevel(
    const nlohmann::json& params, const nlohmann::json& id) {
    auto level_it = params.find("level");
    if (level_it == params.end() || !level_it->is_string()) {
        return MakeError(id, rpc_error::kInvalidParams, "Missing 'level' parameter");
    }
    auto level = ParseMcpLogLevel(level_it->get<std::string>());
    if (!level) {
        return MakeError(id, rpc_error::kInvalidParams,
                         "Unknown log level: " + level_it->get<std::string>());
    }
    if (context_.client_log) {
        context_.client_log->SetLevel(*level);
    }
    LogDebug(kComponent, std::string("Client log level set to ") + McpLogLevelName(*level));
    return MakeResult(id, nlohmann::json::object());
}

nlohmann::json McpServer::MakeError(
    const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

nlohmann::json McpServer::MakeResult(
    const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

} // namespace mcp_host
