#pragma once

#include <mcp_host/core/log.hpp>
#include <mcp_host/pipeline/audit_logger.hpp>
#include <mcp_host/pipeline/authorization.hpp>
#include <mcp_host/pipeline/invocation_pipeline.hpp>
#include <mcp_host/pipeline/rate_limiter.hpp>
#include <mcp_host/pipeline/response_cache.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mcp_host {

struct ServerSettings {
    std::string name = "mcp-host";
    std::string version;  // empty = build version
};

struct PluginSettings {
    bool enabled = true;
    std::string directory = "plugins";
    std::map<std::string, std::string> settings;  // dotted keys, e.g. "greeting.prefix"
};

struct ResourceSettings {
    std::vector<std::string> roots;
};

struct AppConfig {
    ServerSettings server;
    PluginSettings plugins;
    CacheSettings cache;
    RateLimitSettings rate_limit;
    AuditSettings audit;
    AuthSettings auth;
    ExecutionSettings execution;
    ResourceSettings resources;
    std::optional<std::string> log_file;
    LogLevel log_level = LogLevel::Warn;
    bool json_log = false;
};

// Command-line flags. Unset optionals leave the YAML value alone.
struct CliOptions {
    std::optional<std::string> config_path;
    std::optional<std::string> plugins_dir;
    std::optional<std::string> audit_dir;
    std::optional<std::string> api_key_env;
    std::optional<std::string> log_file;
    bool no_plugins = false;
    bool no_audit = false;
    bool no_cache = false;
    bool no_rate_limit = false;
    bool json_log = false;
    bool validate = false;
    bool show_version = false;
    int verbosity = 0;  // -v = info, -vv = debug
};

} // namespace mcp_host
