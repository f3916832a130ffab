#include <catch2/catch_test_macros.hpp>

#include <mcp_host/config/config_loader.hpp>

#include "../mocks/temp_dir.hpp"

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

using namespace mcp_host;
using mcp_host::testing::TempDir;

namespace {

// Tests run from the build directory; testdata lives beside this file's
// parent directory in the source tree.
std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);   // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

Result<CliOptions, Error> ParseArgs(std::vector<const char*> args) {
    args.insert(args.begin(), "mcp-host");
    return LoadFromCli(static_cast<int>(args.size()), args.data());
}

AppConfig ValidBase() {
    AppConfig config;
    config.audit.directory = "audit";
    return config;
}

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("full_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.server.name == "team-tools");
    CHECK(config.server.version == "2.1.0");

    CHECK(config.plugins.enabled);
    CHECK(config.plugins.directory == "/opt/mcp-host/plugins");
    CHECK(config.plugins.settings.at("greeting.prefix") == "Howdy");
    CHECK(config.plugins.settings.at("mixed.mode") == "strict");
    CHECK(config.plugins.settings.at("mixed.tags") == "a,b,c");
    CHECK(config.plugins.settings.at("timeout") == "30");

    CHECK(config.cache.default_ttl_seconds == 120);
    CHECK(config.cache.max_entries == 50);
    CHECK(config.cache.tool_ttls.at("datetime") == 0);
    CHECK(config.cache.tool_ttls.at("text") == 600);

    CHECK(config.rate_limit.default_limit_per_minute == 30);
    CHECK(config.rate_limit.tool_limits.at("environment") == 5);

    CHECK(config.audit.directory == "/var/log/mcp-host/audit");
    CHECK(config.audit.retention_days == 7);

    CHECK(config.auth.require_authentication);
    CHECK(config.auth.api_key_env == "TEAM_TOOLS_KEY");
    REQUIRE(config.auth.api_keys.size() == 2);
    const auto& reader = config.auth.api_keys.at("key-reader");
    CHECK(reader.name == "reader");
    CHECK(reader.allowed_tools == std::vector<std::string>{"text", "datetime"});
    CHECK(reader.allowed_actions.at("text") ==
          std::vector<std::string>{"word_count", "format_json"});
    CHECK(config.auth.api_keys.at("key-admin").allowed_tools ==
          std::vector<std::string>{"*"});

    CHECK(config.execution.timeout_seconds == 20);
    CHECK(config.execution.shutdown_grace_seconds == 3);
    CHECK(config.execution.max_concurrent_calls == 8);

    CHECK(config.resources.roots == std::vector<std::string>{"/srv/docs", "/srv/notes"});

    CHECK(config.log_file == std::optional<std::string>("/var/log/mcp-host/host.log"));
    CHECK(config.log_level == LogLevel::Info);
    CHECK(config.json_log);

    CHECK(ValidateConfig(config).IsOk());
}

TEST_CASE("LoadFromYaml: minimal config keeps defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.server.name == "minimal");
    CHECK(config.plugins.enabled);
    CHECK(config.plugins.directory == "plugins");
    CHECK(config.cache.enabled);
    CHECK(config.cache.default_ttl_seconds == 300);
    CHECK(config.cache.max_entries == 1000);
    CHECK(config.rate_limit.default_limit_per_minute == 60);
    CHECK(config.audit.retention_days == 30);
    CHECK_FALSE(config.auth.require_authentication);
    CHECK(config.auth.api_key_env == "MCP_HOST_API_KEY");
    CHECK(config.execution.timeout_seconds == 0);
    CHECK(config.execution.shutdown_grace_seconds == 5);
    CHECK(config.execution.max_concurrent_calls == 4);
    CHECK_FALSE(config.log_file.has_value());
    CHECK(config.log_level == LogLevel::Warn);
    CHECK_FALSE(config.json_log);
}

TEST_CASE("LoadFromYaml: nonexistent file", "[config][yaml]") {
    auto result = LoadFromYaml("/nonexistent/path/config.yaml");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(result.Error().subject == std::optional<std::string>("/nonexistent/path/config.yaml"));
}

TEST_CASE("LoadFromYaml: syntax error", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("invalid_syntax.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("Failed to parse YAML file") != std::string::npos);
    CHECK(result.Error().ExitCode() == 2);
}

TEST_CASE("LoadFromYaml: invalid log level", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("invalid_log_level.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Invalid log_level: chatty");
}

TEST_CASE("LoadFromYamlString: empty document and wrong shapes", "[config][yaml]") {
    auto empty = LoadFromYamlString("");
    REQUIRE(empty.IsOk());
    CHECK(empty.Value().server.name == "mcp-host");

    CHECK(LoadFromYamlString("- just\n- a list\n").IsErr());
    CHECK(LoadFromYamlString("auth:\n  api_keys: [a, b]\n").IsErr());
    CHECK(LoadFromYamlString("auth:\n  api_keys:\n    k: nope\n").IsErr());
    CHECK(LoadFromYamlString("cache:\n  max_entries: lots\n").IsErr());
}

TEST_CASE("LoadFromYamlString: scalar allowed_tools becomes a one-item list", "[config][yaml]") {
    auto result = LoadFromYamlString(
        "auth:\n"
        "  api_keys:\n"
        "    k1:\n"
        "      name: solo\n"
        "      allowed_tools: text\n");
    REQUIRE(result.IsOk());
    CHECK(result.Value().auth.api_keys.at("k1").allowed_tools ==
          std::vector<std::string>{"text"});
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: no arguments", "[config][cli]") {
    auto result = ParseArgs({});
    REQUIRE(result.IsOk());
    const auto& cli = result.Value();
    CHECK_FALSE(cli.config_path.has_value());
    CHECK_FALSE(cli.no_plugins);
    CHECK_FALSE(cli.validate);
    CHECK_FALSE(cli.show_version);
    CHECK(cli.verbosity == 0);
}

TEST_CASE("LoadFromCli: every flag", "[config][cli]") {
    auto result = ParseArgs({"-c", "host.yaml", "--plugins-dir", "/p", "--audit-dir", "/a",
                             "--api-key-env", "KEY_VAR", "--log-file", "/l.log",
                             "--no-plugins", "--no-audit", "--no-cache", "--no-rate-limit",
                             "--json-log", "--validate"});
    REQUIRE(result.IsOk());
    const auto& cli = result.Value();
    CHECK(cli.config_path == std::optional<std::string>("host.yaml"));
    CHECK(cli.plugins_dir == std::optional<std::string>("/p"));
    CHECK(cli.audit_dir == std::optional<std::string>("/a"));
    CHECK(cli.api_key_env == std::optional<std::string>("KEY_VAR"));
    CHECK(cli.log_file == std::optional<std::string>("/l.log"));
    CHECK(cli.no_plugins);
    CHECK(cli.no_audit);
    CHECK(cli.no_cache);
    CHECK(cli.no_rate_limit);
    CHECK(cli.json_log);
    CHECK(cli.validate);
}

TEST_CASE("LoadFromCli: repeated -v raises verbosity", "[config][cli]") {
    auto once = ParseArgs({"-v"});
    REQUIRE(once.IsOk());
    CHECK(once.Value().verbosity == 1);

    auto twice = ParseArgs({"-v", "--verbose"});
    REQUIRE(twice.IsOk());
    CHECK(twice.Value().verbosity == 2);
}

TEST_CASE("LoadFromCli: --version", "[config][cli]") {
    auto result = ParseArgs({"--version"});
    REQUIRE(result.IsOk());
    CHECK(result.Value().show_version);
}

TEST_CASE("LoadFromCli: unknown flag is a config error", "[config][cli]") {
    auto result = ParseArgs({"--frobnicate"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(result.Error().message.find("CLI parse error") != std::string::npos);
}

// ===========================================================================
// ApplyCliOverrides
// ===========================================================================

TEST_CASE("ApplyCliOverrides: flags win over file values", "[config][cli]") {
    auto loaded = LoadFromYaml(TestDataPath("full_config.yaml"));
    REQUIRE(loaded.IsOk());

    CliOptions cli;
    cli.plugins_dir = "/cli/plugins";
    cli.audit_dir = "/cli/audit";
    cli.api_key_env = "CLI_KEY";
    cli.log_file = "/cli/host.log";
    cli.no_cache = true;
    cli.no_rate_limit = true;
    cli.verbosity = 2;

    auto config = ApplyCliOverrides(loaded.Value(), cli);
    CHECK(config.plugins.directory == "/cli/plugins");
    CHECK(config.plugins.enabled);
    CHECK(config.audit.directory == "/cli/audit");
    CHECK(config.audit.enabled);
    CHECK(config.auth.api_key_env == "CLI_KEY");
    CHECK(config.log_file == std::optional<std::string>("/cli/host.log"));
    CHECK_FALSE(config.cache.enabled);
    CHECK_FALSE(config.rate_limit.enabled);
    CHECK(config.log_level == LogLevel::Debug);
    // Untouched values come from the file.
    CHECK(config.server.name == "team-tools");
    CHECK(config.execution.max_concurrent_calls == 8);
}

TEST_CASE("ApplyCliOverrides: unset flags change nothing", "[config][cli]") {
    AppConfig base;
    base.log_level = LogLevel::Error;
    auto config = ApplyCliOverrides(base, CliOptions{});
    CHECK(config.plugins.enabled);
    CHECK(config.audit.enabled);
    CHECK(config.log_level == LogLevel::Error);
    CHECK_FALSE(config.json_log);
}

TEST_CASE("ApplyCliOverrides: single -v never lowers debug", "[config][cli]") {
    AppConfig base;
    base.log_level = LogLevel::Debug;
    CliOptions cli;
    cli.verbosity = 1;
    CHECK(ApplyCliOverrides(base, cli).log_level == LogLevel::Debug);

    base.log_level = LogLevel::Warn;
    CHECK(ApplyCliOverrides(base, cli).log_level == LogLevel::Info);
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

TEST_CASE("ValidateConfig: defaults are valid", "[config][validate]") {
    CHECK(ValidateConfig(AppConfig{}).IsOk());
}

TEST_CASE("ValidateConfig: rejects out-of-range values", "[config][validate]") {
    auto config = ValidBase();

    SECTION("empty server name") {
        config.server.name.clear();
    }
    SECTION("negative cache ttl") {
        config.cache.default_ttl_seconds = -1;
    }
    SECTION("zero max entries") {
        config.cache.max_entries = 0;
    }
    SECTION("negative per-tool ttl") {
        config.cache.tool_ttls["text"] = -5;
    }
    SECTION("negative rate limit") {
        config.rate_limit.default_limit_per_minute = -1;
    }
    SECTION("negative per-tool limit") {
        config.rate_limit.tool_limits["text"] = -1;
    }
    SECTION("negative retention") {
        config.audit.retention_days = -1;
    }
    SECTION("empty audit directory") {
        config.audit.directory.clear();
    }
    SECTION("negative timeout") {
        config.execution.timeout_seconds = -1;
    }
    SECTION("negative grace") {
        config.execution.shutdown_grace_seconds = -1;
    }
    SECTION("no workers") {
        config.execution.max_concurrent_calls = 0;
    }
    SECTION("auth required without keys") {
        config.auth.require_authentication = true;
    }
    SECTION("key without name") {
        config.auth.api_keys["k"] = ApiKeyEntry{"", {"*"}, {}};
    }
    SECTION("key without tools") {
        config.auth.api_keys["k"] = ApiKeyEntry{"ops", {}, {}};
    }

    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("ValidateConfig: empty audit directory is fine when auditing is off", "[config][validate]") {
    AppConfig config;
    config.audit.enabled = false;
    config.audit.directory.clear();
    CHECK(ValidateConfig(config).IsOk());
}

// ===========================================================================
// RunEnvironmentChecks
// ===========================================================================

TEST_CASE("RunEnvironmentChecks: all checks pass", "[config][validate]") {
    TempDir dir("env_checks_ok");
    std::filesystem::create_directories(dir.Path() / "plugins");
    std::filesystem::create_directories(dir.Path() / "docs");
    ::setenv("MCP_HOST_TEST_ENV_KEY", "k1", 1);

    AppConfig config;
    config.plugins.directory = (dir.Path() / "plugins").string();
    config.audit.directory = (dir.Path() / "audit").string();
    config.resources.roots = {(dir.Path() / "docs").string()};
    config.auth.require_authentication = true;
    config.auth.api_key_env = "MCP_HOST_TEST_ENV_KEY";
    config.auth.api_keys["k1"] = ApiKeyEntry{"ops", {"*"}, {}};

    std::ostringstream out;
    CHECK(RunEnvironmentChecks(config, out));

    auto text = out.str();
    CHECK(text.find("✗") == std::string::npos);
    CHECK(text.find("audit directory") != std::string::npos);
    CHECK(text.find("MCP_HOST_TEST_ENV_KEY is set") != std::string::npos);
    CHECK(text.find("1 API key(s) configured") != std::string::npos);
    CHECK_FALSE(std::filesystem::exists(dir.Path() / "audit" / ".mcp-host-write-test"));
}

TEST_CASE("RunEnvironmentChecks: reports each failure", "[config][validate]") {
    TempDir dir("env_checks_fail");
    ::unsetenv("MCP_HOST_TEST_ENV_MISSING");

    AppConfig config;
    config.plugins.directory = (dir.Path() / "no-plugins").string();
    config.audit.enabled = false;
    config.resources.roots = {(dir.Path() / "no-docs").string()};
    config.auth.require_authentication = true;
    config.auth.api_key_env = "MCP_HOST_TEST_ENV_MISSING";

    std::ostringstream out;
    CHECK_FALSE(RunEnvironmentChecks(config, out));

    auto text = out.str();
    CHECK(text.find("not found") != std::string::npos);
    CHECK(text.find("MCP_HOST_TEST_ENV_MISSING is not set") != std::string::npos);
    CHECK(text.find("audit directory") == std::string::npos);
}
