#include <mcp_host/config/config_loader.hpp>

#include <mcp_host/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace mcp_host {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error::Make("ConfigLoader", message, ErrorCategory::Config);
}

std::vector<std::string> ParseStringList(const YAML::Node& node) {
    std::vector<std::string> out;
    if (node.IsSequence()) {
        for (const auto& item : node) {
            out.push_back(item.as<std::string>());
        }
    } else if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
    }
    return out;
}

std::map<std::string, int> ParseIntMap(const YAML::Node& node) {
    std::map<std::string, int> out;
    if (!node.IsMap()) {
        return out;
    }
    for (const auto& kv : node) {
        out[kv.first.as<std::string>()] = kv.second.as<int>();
    }
    return out;
}

// Nested plugin settings become dotted keys: {greeting: {prefix: Hi}}
// -> "greeting.prefix" = "Hi". Sequences are joined with commas.
void FlattenSettings(const YAML::Node& node, const std::string& prefix,
                     std::map<std::string, std::string>& out) {
    if (node.IsMap()) {
        for (const auto& kv : node) {
            auto key = kv.first.as<std::string>();
            FlattenSettings(kv.second,
                            prefix.empty() ? key : prefix + "." + key, out);
        }
    } else if (node.IsSequence()) {
        std::string joined;
        for (const auto& item : node) {
            if (!joined.empty()) {
                joined += ",";
            }
            joined += item.as<std::string>();
        }
        out[prefix] = joined;
    } else if (node.IsScalar()) {
        out[prefix] = node.as<std::string>();
    }
}

Result<ApiKeyEntry, Error> ParseApiKey(const std::string& key,
                                       const YAML::Node& node) {
    if (!node.IsMap()) {
        return Result<ApiKeyEntry, Error>::Err(
            MakeConfigError("API key entry '" + key + "' must be a mapping"));
    }
    ApiKeyEntry entry;
    if (node["name"]) {
        entry.name = node["name"].as<std::string>();
    }
    if (node["allowed_tools"]) {
        entry.allowed_tools = ParseStringList(node["allowed_tools"]);
    }
    if (node["allowed_actions"] && node["allowed_actions"].IsMap()) {
        for (const auto& kv : node["allowed_actions"]) {
            entry.allowed_actions[kv.first.as<std::string>()] =
                ParseStringList(kv.second);
        }
    }
    return Result<ApiKeyEntry, Error>::Ok(std::move(entry));
}

Result<AppConfig, Error> ParseRoot(const YAML::Node& root) {
    AppConfig config;
    if (!root || root.IsNull()) {
        return Result<AppConfig, Error>::Ok(std::move(config));
    }
    if (!root.IsMap()) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Top-level YAML node must be a mapping"));
    }

    // -- Server --
    if (const auto server = root["server"]) {
        if (server["name"]) {
            config.server.name = server["name"].as<std::string>();
        }
        if (server["version"]) {
            config.server.version = server["version"].as<std::string>();
        }
    }

    // -- Plugins --
    if (const auto plugins = root["plugins"]) {
        if (plugins["enabled"]) {
            config.plugins.enabled = plugins["enabled"].as<bool>();
        }
        if (plugins["directory"]) {
            config.plugins.directory = plugins["directory"].as<std::string>();
        }
        if (plugins["settings"]) {
            FlattenSettings(plugins["settings"], "", config.plugins.settings);
        }
    }

    // -- Cache --
    if (const auto cache = root["cache"]) {
        if (cache["enabled"]) {
            config.cache.enabled = cache["enabled"].as<bool>();
        }
        if (cache["default_ttl_seconds"]) {
            config.cache.default_ttl_seconds = cache["default_ttl_seconds"].as<int>();
        }
        if (cache["max_entries"]) {
            config.cache.max_entries = cache["max_entries"].as<int>();
        }
        if (cache["tool_ttls"]) {
            config.cache.tool_ttls = ParseIntMap(cache["tool_ttls"]);
        }
    }

    // -- Rate limit --
    if (const auto rate = root["rate_limit"]) {
        if (rate["enabled"]) {
            config.rate_limit.enabled = rate["enabled"].as<bool>();
        }
        if (rate["default_limit_per_minute"]) {
            config.rate_limit.default_limit_per_minute =
                rate["default_limit_per_minute"].as<int>();
        }
        if (rate["tool_limits"]) {
            config.rate_limit.tool_limits = ParseIntMap(rate["tool_limits"]);
        }
    }

    // -- Audit --
    if (const auto audit = root["audit"]) {
        if (audit["enabled"]) {
            config.audit.enabled = audit["enabled"].as<bool>();
        }
        if (audit["directory"]) {
            config.audit.directory = audit["directory"].as<std::string>();
        }
        if (audit["retention_days"]) {
            config.audit.retention_days = audit["retention_days"].as<int>();
        }
    }

    // -- Auth --
    if (const auto auth = root["auth"]) {
        if (auth["require_authentication"]) {
            config.auth.require_authentication =
                auth["require_authentication"].as<bool>();
        }
        if (auth["api_key_env"]) {
            config.auth.api_key_env = auth["api_key_env"].as<std::string>();
        }
        if (auth["api_keys"]) {
            if (!auth["api_keys"].IsMap()) {
                return Result<AppConfig, Error>::Err(
                    MakeConfigError("auth.api_keys must be a mapping"));
            }
            for (const auto& kv : auth["api_keys"]) {
                auto key = kv.first.as<std::string>();
                auto entry = ParseApiKey(key, kv.second);
                if (entry.IsErr()) {
                    return Result<AppConfig, Error>::Err(std::move(entry).Error());
                }
                config.auth.api_keys[key] = std::move(entry).Value();
            }
        }
    }

    // -- Execution --
    if (const auto exec = root["execution"]) {
        if (exec["timeout_seconds"]) {
            config.execution.timeout_seconds = exec["timeout_seconds"].as<int>();
        }
        if (exec["shutdown_grace_seconds"]) {
            config.execution.shutdown_grace_seconds =
                exec["shutdown_grace_seconds"].as<int>();
        }
        if (exec["max_concurrent_calls"]) {
            config.execution.max_concurrent_calls =
                exec["max_concurrent_calls"].as<int>();
        }
    }

    // -- Resources --
    if (const auto resources = root["resources"]) {
        if (resources["roots"]) {
            config.resources.roots = ParseStringList(resources["roots"]);
        }
    }

    // -- Logging --
    if (root["log_file"]) {
        config.log_file = root["log_file"].as<std::string>();
    }
    if (root["log_level"]) {
        auto text = root["log_level"].as<std::string>();
        auto level = ParseLogLevel(text);
        if (!level.has_value()) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Invalid log_level: " + text));
        }
        config.log_level = *level;
    }
    if (root["json_log"]) {
        config.json_log = root["json_log"].as<bool>();
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    try {
        return ParseRoot(YAML::LoadFile(std::string(file_path)));
    } catch (const YAML::Exception& e) {
        auto err = MakeConfigError("Failed to parse YAML file: " + std::string(e.what()));
        err.subject = std::string(file_path);
        return Result<AppConfig, Error>::Err(std::move(err));
    }
}

Result<AppConfig, Error> LoadFromYamlString(std::string_view yaml) {
    try {
        return ParseRoot(YAML::Load(std::string(yaml)));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML: " + std::string(e.what())));
    }
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("mcp-host", kVersion,
                                     argparse::default_arguments::help);
    program.add_description(
        "MCP tool-invocation host speaking JSON-RPC 2.0 over stdin/stdout.");

    CliOptions cli;

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--plugins-dir")
        .help("Directory scanned for tool plugins");
    program.add_argument("--no-plugins")
        .help("Skip plugin discovery")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--audit-dir")
        .help("Directory for daily audit files");
    program.add_argument("--no-audit")
        .help("Disable the audit trail")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-cache")
        .help("Disable the response cache")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-rate-limit")
        .help("Disable per-tool rate limiting")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--api-key-env")
        .help("Environment variable holding this session's API key");
    program.add_argument("--log-file")
        .help("Write diagnostics to this file instead of stderr");
    program.add_argument("--json-log")
        .help("Emit diagnostics as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Increase diagnostic verbosity (-v info, -vv debug)")
        .action([&cli](const auto&) { ++cli.verbosity; })
        .append()
        .default_value(false)
        .implicit_value(true)
        .nargs(0);
    program.add_argument("--validate")
        .help("Check configuration and environment, then exit")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    cli.config_path = program.present("--config");
    cli.plugins_dir = program.present("--plugins-dir");
    cli.audit_dir = program.present("--audit-dir");
    cli.api_key_env = program.present("--api-key-env");
    cli.log_file = program.present("--log-file");
    cli.no_plugins = program.get<bool>("--no-plugins");
    cli.no_audit = program.get<bool>("--no-audit");
    cli.no_cache = program.get<bool>("--no-cache");
    cli.no_rate_limit = program.get<bool>("--no-rate-limit");
    cli.json_log = program.get<bool>("--json-log");
    cli.validate = program.get<bool>("--validate");
    cli.show_version = program.get<bool>("--version");

    return Result<CliOptions, Error>::Ok(std::move(cli));
}

// ---------------------------------------------------------------------------
// ApplyCliOverrides
// ---------------------------------------------------------------------------
AppConfig ApplyCliOverrides(AppConfig config, const CliOptions& cli) {
    if (cli.plugins_dir.has_value()) {
        config.plugins.directory = *cli.plugins_dir;
    }
    if (cli.no_plugins) {
        config.plugins.enabled = false;
    }
    if (cli.audit_dir.has_value()) {
        config.audit.directory = *cli.audit_dir;
    }
    if (cli.no_audit) {
        config.audit.enabled = false;
    }
    if (cli.no_cache) {
        config.cache.enabled = false;
    }
    if (cli.no_rate_limit) {
        config.rate_limit.enabled = false;
    }
    if (cli.api_key_env.has_value()) {
        config.auth.api_key_env = *cli.api_key_env;
    }
    if (cli.log_file.has_value()) {
        config.log_file = cli.log_file;
    }
    if (cli.json_log) {
        config.json_log = true;
    }
    if (cli.verbosity >= 2) {
        config.log_level = LogLevel::Debug;
    } else if (cli.verbosity == 1 && config.log_level != LogLevel::Debug) {
        config.log_level = LogLevel::Info;
    }
    return config;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    auto fail = [](const std::string& message) {
        return Result<void, Error>::Err(MakeConfigError(message));
    };

    if (config.server.name.empty()) {
        return fail("server.name must not be empty");
    }
    if (config.cache.default_ttl_seconds < 0) {
        return fail("cache.default_ttl_seconds must not be negative, got " +
                    std::to_string(config.cache.default_ttl_seconds));
    }
    if (config.cache.max_entries < 1) {
        return fail("cache.max_entries must be at least 1, got " +
                    std::to_string(config.cache.max_entries));
    }
    for (const auto& [tool, ttl] : config.cache.tool_ttls) {
        if (ttl < 0) {
            return fail("cache.tool_ttls." + tool + " must not be negative");
        }
    }
    if (config.rate_limit.default_limit_per_minute < 0) {
        return fail("rate_limit.default_limit_per_minute must not be negative, got " +
                    std::to_string(config.rate_limit.default_limit_per_minute));
    }
    for (const auto& [tool, limit] : config.rate_limit.tool_limits) {
        if (limit < 0) {
            return fail("rate_limit.tool_limits." + tool + " must not be negative");
        }
    }
    if (config.audit.retention_days < 0) {
        return fail("audit.retention_days must not be negative, got " +
                    std::to_string(config.audit.retention_days));
    }
    if (config.audit.enabled && config.audit.directory.empty()) {
        return fail("audit.directory must not be empty when auditing is enabled");
    }
    if (config.execution.timeout_seconds < 0) {
        return fail("execution.timeout_seconds must not be negative");
    }
    if (config.execution.shutdown_grace_seconds < 0) {
        return fail("execution.shutdown_grace_seconds must not be negative");
    }
    if (config.execution.max_concurrent_calls < 1) {
        return fail("execution.max_concurrent_calls must be at least 1, got " +
                    std::to_string(config.execution.max_concurrent_calls));
    }
    if (config.auth.require_authentication && config.auth.api_keys.empty()) {
        return fail("auth.require_authentication is set but no api_keys are configured");
    }
    for (const auto& [key, entry] : config.auth.api_keys) {
        if (key.empty()) {
            return fail("auth.api_keys contains an empty key");
        }
        if (entry.name.empty()) {
            return fail("API key entry is missing 'name'");
        }
        if (entry.allowed_tools.empty()) {
            return fail("API key '" + entry.name + "' has no allowed_tools");
        }
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// RunEnvironmentChecks
// ---------------------------------------------------------------------------
bool RunEnvironmentChecks(const AppConfig& config, std::ostream& out) {
    namespace fs = std::filesystem;
    bool all_ok = true;
    auto report = [&](bool ok, const std::string& message) {
        out << (ok ? "✓ " : "✗ ") << message << "\n";
        all_ok = all_ok && ok;
    };

    if (config.plugins.enabled) {
        std::error_code ec;
        bool present = fs::is_directory(config.plugins.directory, ec);
        report(present, "plugins directory " + config.plugins.directory +
                            (present ? " exists" : " not found"));
    }

    if (config.audit.enabled) {
        std::error_code ec;
        fs::create_directories(config.audit.directory, ec);
        auto probe = fs::path(config.audit.directory) / ".mcp-host-write-test";
        bool writable = false;
        {
            std::ofstream f(probe, std::ios::app);
            writable = f.good();
        }
        fs::remove(probe, ec);
        report(writable, "audit directory " + config.audit.directory +
                             (writable ? " is writable" : " is not writable"));
    }

    for (const auto& root : config.resources.roots) {
        std::error_code ec;
        bool present = fs::is_directory(root, ec);
        report(present, "resource root " + root +
                            (present ? " exists" : " not found"));
    }

    if (config.auth.require_authentication) {
        const char* value = std::getenv(config.auth.api_key_env.c_str());
        bool set = value != nullptr && *value != '\0';
        report(set, "environment variable " + config.auth.api_key_env +
                        (set ? " is set" : " is not set"));
    }

    report(true, std::to_string(config.auth.api_keys.size()) +
                     " API key(s) configured");
    return all_ok;
}

} // namespace mcp_host
