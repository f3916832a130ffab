#pragma once

#include <mcp_host/plugin/plugin_context.hpp>
#include <mcp_host/plugin/tool.hpp>

#include <cstddef>
#include <cstdint>
#include <type_traits>

// ---------------------------------------------------------------------------
// Plugin ABI
//
// A plugin is a shared object linked against libmcp_host_plugin_api that
// exports one C symbol, `mcp_host_plugin_manifest`, returning a static
// PluginManifest. The host accepts a plugin when the ABI major version is
// equal and the plugin's minor version is not newer than the host's.
//
// Minimal plugin:
//
//   class HelloTool : public mcp_host::ITool { ... };
//   MCP_HOST_DECLARE_PLUGIN("hello", MCP_HOST_TOOL(HelloTool))
// ---------------------------------------------------------------------------

#define MCP_HOST_PLUGIN_ABI_MAJOR 1
#define MCP_HOST_PLUGIN_ABI_MINOR 0

#if defined(_WIN32)
#define MCP_HOST_PLUGIN_EXPORT __declspec(dllexport)
#else
#define MCP_HOST_PLUGIN_EXPORT __attribute__((visibility("default")))
#endif

namespace mcp_host {

constexpr uint32_t kPluginAbiVersion =
    (static_cast<uint32_t>(MCP_HOST_PLUGIN_ABI_MAJOR) << 16) |
    static_cast<uint32_t>(MCP_HOST_PLUGIN_ABI_MINOR);

constexpr const char* kPluginEntryPoint = "mcp_host_plugin_manifest";

// One entry per tool type. Either factory may be null; the host prefers
// create_with_context. Returned objects are owned by the host and destroyed
// through ITool's virtual destructor.
struct ToolFactory {
    const char* type_name;
    ITool* (*create_with_context)(const PluginContext* context);
    ITool* (*create)();
};

struct PluginManifest {
    uint32_t abi_version;
    const char* plugin_name;
    const ToolFactory* factories;
    std::size_t factory_count;
};

using PluginManifestFn = const PluginManifest* (*)();

namespace plugin_abi {

template <typename T>
ITool* CreateWithContext(const PluginContext* context) {
    return new T(*context);
}

template <typename T>
ITool* CreateDefault() {
    return new T();
}

template <typename T>
constexpr ToolFactory MakeToolFactory(const char* type_name) {
    static_assert(std::is_base_of<ITool, T>::value,
                  "plugin tool types must derive from mcp_host::ITool");
    ToolFactory factory{type_name, nullptr, nullptr};
    if constexpr (std::is_constructible<T, const PluginContext&>::value) {
        factory.create_with_context = &CreateWithContext<T>;
    }
    if constexpr (std::is_default_constructible<T>::value) {
        factory.create = &CreateDefault<T>;
    }
    return factory;
}

} // namespace plugin_abi
} // namespace mcp_host

#define MCP_HOST_TOOL(Type) ::mcp_host::plugin_abi::MakeToolFactory<Type>(#Type)

#define MCP_HOST_DECLARE_PLUGIN(plugin_name, ...)                              \
    extern "C" MCP_HOST_PLUGIN_EXPORT const ::mcp_host::PluginManifest*        \
    mcp_host_plugin_manifest() {                                               \
        static const ::mcp_host::ToolFactory kFactories[] = {__VA_ARGS__};     \
        static const ::mcp_host::PluginManifest kManifest{                     \
            ::mcp_host::kPluginAbiVersion, plugin_name, kFactories,            \
            sizeof(kFactories) / sizeof(kFactories[0])};                       \
        return &kManifest;                                                     \
    }
