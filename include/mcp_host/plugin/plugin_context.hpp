#pragma once

#include <mcp_host/core/log.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace mcp_host {

using ConfigLookup =
    std::function<std::optional<std::string>(const std::string& key)>;
using DiagnosticSink =
    std::function<void(LogLevel level, std::string_view message)>;

// ---------------------------------------------------------------------------
// PluginContext — handed to plugin tools that declare a constructor taking
// `const PluginContext&`. Gives scoped configuration lookup and a diagnostic
// sink without exposing host internals. Plugins may copy it freely.
// ---------------------------------------------------------------------------
class PluginContext {
public:
    PluginContext(std::string plugin_name, ConfigLookup lookup,
                  DiagnosticSink sink);

    [[nodiscard]] const std::string& PluginName() const noexcept {
        return plugin_name_;
    }

    /// Looks up "<plugin>.<key>" first, then the shared "<key>".
    [[nodiscard]] std::optional<std::string> GetConfig(const std::string& key) const;

    void LogDebug(std::string_view message) const;
    void LogInfo(std::string_view message) const;
    void LogWarn(std::string_view message) const;
    void LogError(std::string_view message) const;

private:
    void Emit(LogLevel level, std::string_view message) const;

    std::string plugin_name_;
    ConfigLookup lookup_;
    DiagnosticSink sink_;
};

} // namespace mcp_host
