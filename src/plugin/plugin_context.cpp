#include <mcp_host/plugin/plugin_context.hpp>

namespace mcp_host {

PluginContext::PluginContext(std::string plugin_name, ConfigLookup lookup,
                             DiagnosticSink sink)
    : plugin_name_(std::move(plugin_name)),
      lookup_(std::move(lookup)),
      sink_(std::move(sink)) {}

std::optional<std::string> PluginContext::GetConfig(const std::string& key) const {
    if (!lookup_) {
        return std::nullopt;
    }
    if (auto scoped = lookup_(plugin_name_ + "." + key)) {
        return scoped;
    }
    return lookup_(key);
}

void PluginContext::LogDebug(std::string_view message) const {
    Emit(LogLevel::Debug, message);
}

void PluginContext::LogInfo(std::string_view message) const {
    Emit(LogLevel::Info, message);
}

void PluginContext::LogWarn(std::string_view message) const {
    Emit(LogLevel::Warn, message);
}

void PluginContext::LogError(std::string_view message) const {
    Emit(LogLevel::Error, message);
}

void PluginContext::Emit(LogLevel level, std::string_view message) const {
    if (sink_) {
        sink_(level, message);
    }
}

} // namespace mcp_host
