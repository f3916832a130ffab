#include <mcp_host/config/config_loader.hpp>
#include <mcp_host/core/log.hpp>
#include <mcp_host/core/terminal.hpp>
#include <mcp_host/core/version.hpp>
#include <mcp_host/mcp/builtin_tools.hpp>
#include <mcp_host/mcp/client_log_sink.hpp>
#include <mcp_host/mcp/mcp_server.hpp>
#include <mcp_host/mcp/prompt_provider.hpp>
#include <mcp_host/mcp/resource_provider.hpp>
#include <mcp_host/mcp/tool_registry.hpp>
#include <mcp_host/pipeline/audit_logger.hpp>
#include <mcp_host/pipeline/authorization.hpp>
#include <mcp_host/pipeline/invocation_pipeline.hpp>
#include <mcp_host/pipeline/rate_limiter.hpp>
#include <mcp_host/pipeline/response_cache.hpp>
#include <mcp_host/plugin/plugin_loader.hpp>

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <unistd.h>

using namespace mcp_host;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitValidationFailed = 1;
constexpr int kExitConfig = 2;
constexpr int kExitInternal = 99;

constexpr const char* kComponent = "main";

void PrintError(const Error& error) {
    std::cerr << "Error: " << error.ToString() << "\n";
}

// Closing stdin ends the read loop, which runs the normal shutdown path.
void HandleTerminationSignal(int) {
    ::close(STDIN_FILENO);
}

void InstallSignalHandlers() {
    struct sigaction sa {};
    sa.sa_handler = HandleTerminationSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;  // no SA_RESTART: interrupt the blocking read
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

// Local diagnostics go to stderr or the log file, never stdout; the client
// sink forwards records to the MCP client.
void InitLogging(const AppConfig& config,
                 const std::shared_ptr<ClientLogSink>& client_sink) {
    std::unique_ptr<ILogSink> local;
    if (config.log_file.has_value()) {
        auto file = std::make_unique<FileSink>(*config.log_file, config.json_log);
        if (!file->IsOpen()) {
            std::cerr << "Warning: cannot open log file " << *config.log_file
                      << ", logging to stderr\n";
        } else {
            local = std::move(file);
        }
    }
    if (!local) {
        if (config.json_log) {
            local = std::make_unique<JsonSink>(std::cerr);
        } else {
            bool use_color = !NoColorEnvSet() && IsStderrTty();
            local = std::make_unique<ColorConsoleSink>(use_color);
        }
    }

    std::vector<std::shared_ptr<ILogSink>> sinks;
    sinks.push_back(std::make_shared<LevelFilterSink>(std::move(local),
                                                      config.log_level));
    sinks.push_back(client_sink);
    InitGlobalLogger(std::make_unique<TeeSink>(std::move(sinks)),
                     LogLevel::Debug);
}

std::optional<std::string> ReadCredential(const AuthSettings& auth) {
    const char* value = std::getenv(auth.api_key_env.c_str());
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

int RunHost(const AppConfig& config) {
    auto client_sink = std::make_shared<ClientLogSink>();
    InitLogging(config, client_sink);
    LogInfo(kComponent, std::string("mcp-host ") + kVersion + " starting");

    // Built-ins first so they win name collisions with plugins.
    ToolRegistry registry;
    RegisterBuiltInTools(registry);
    if (config.plugins.enabled) {
        PluginLoader loader(config.plugins.directory, config.plugins.settings);
        auto accepted = registry.RegisterAll(loader.LoadPlugins(), ToolOrigin::Plugin);
        LogInfo(kComponent, "Registered " + std::to_string(accepted) + " plugin tool(s)");
    } else {
        LogInfo(kComponent, "Plugin discovery disabled");
    }

    std::unique_ptr<IRateLimiter> limiter;
    if (config.rate_limit.enabled) {
        limiter = std::make_unique<SlidingWindowRateLimiter>(config.rate_limit);
    } else {
        limiter = std::make_unique<NullRateLimiter>();
    }

    std::unique_ptr<IResponseCache> cache;
    if (config.cache.enabled) {
        cache = std::make_unique<MemoryResponseCache>(config.cache);
    } else {
        cache = std::make_unique<NullResponseCache>();
    }

    std::unique_ptr<IAuditLogger> audit;
    if (config.audit.enabled) {
        audit = std::make_unique<FileAuditLogger>(config.audit.directory,
                                                  config.audit.retention_days);
    } else {
        audit = std::make_unique<NullAuditLogger>();
    }

    std::unique_ptr<IAuthorizationService> auth;
    if (config.auth.require_authentication || !config.auth.api_keys.empty()) {
        auth = std::make_unique<ApiKeyAuthorizationService>(config.auth);
    } else {
        auth = std::make_unique<NullAuthorizationService>();
    }

    InvocationPipeline pipeline(registry, *auth, *limiter, *cache, *audit,
                                config.execution);

    std::vector<std::filesystem::path> roots(config.resources.roots.begin(),
                                             config.resources.roots.end());
    ServerContext context{
        registry,
        pipeline,
        {std::make_shared<FileSystemResourceProvider>(std::move(roots))},
        {std::make_shared<BuiltInPromptProvider>()},
        client_sink,
    };

    ServerOptions options;
    options.name = config.server.name;
    options.version = config.server.version;
    options.credential = ReadCredential(config.auth);
    options.max_concurrent_calls = config.execution.max_concurrent_calls;

    LogInfo(kComponent, "Serving " + std::to_string(registry.Size()) +
                            " tool(s) on stdio");
    {
        McpServer server(std::move(context), std::move(options));
        server.Run();
    }
    LogInfo(kComponent, "Shut down");
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        PrintError(cli_result.Error());
        return kExitConfig;
    }
    const auto cli = std::move(cli_result).Value();

    if (cli.show_version) {
        std::cout << "mcp-host " << kVersion << "\n";
        return kExitSuccess;
    }

    AppConfig config;
    if (cli.config_path.has_value()) {
        auto yaml_result = LoadFromYaml(*cli.config_path);
        if (yaml_result.IsErr()) {
            PrintError(yaml_result.Error());
            return kExitConfig;
        }
        config = std::move(yaml_result).Value();
    }
    config = ApplyCliOverrides(std::move(config), cli);

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        PrintError(valid.Error());
        return kExitConfig;
    }

    if (cli.validate) {
        std::cout << "✓ configuration is valid\n";
        return RunEnvironmentChecks(config, std::cout) ? kExitSuccess
                                                       : kExitValidationFailed;
    }

    InstallSignalHandlers();
    try {
        return RunHost(config);
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << "\n";
        return kExitInternal;
    }
}
