#pragma once

#include <mcp_host/config/app_config.hpp>
#include <mcp_host/core/result.hpp>

#include <ostream>
#include <string>
#include <string_view>

namespace mcp_host {

// Parse a YAML config file into an AppConfig. Missing keys keep defaults.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse YAML text (same schema as LoadFromYaml).
Result<AppConfig, Error> LoadFromYamlString(std::string_view yaml);

// Parse CLI arguments.
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv);

// CLI flags take precedence over the file.
AppConfig ApplyCliOverrides(AppConfig config, const CliOptions& cli);

// Validate that values are sane and internally consistent.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Environment checks behind --validate. Prints one ✓/✗ line per check.
// Returns true when every check passed.
bool RunEnvironmentChecks(const AppConfig& config, std::ostream& out);

} // namespace mcp_host
