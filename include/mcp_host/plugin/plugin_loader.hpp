#pragma once

#include <mcp_host/core/result.hpp>
#include <mcp_host/plugin/plugin_abi.hpp>
#include <mcp_host/plugin/tool.hpp>

#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mcp_host {

// ---------------------------------------------------------------------------
// PluginUnit — one dlopen'ed shared object (RTLD_LOCAL, so its symbols stay
// private to it). Owns the handle and the PluginContexts handed to its tools.
// Every tool instance it produces holds a reference to the unit, so the
// library stays mapped until the last instance is gone.
// ---------------------------------------------------------------------------
class PluginUnit {
public:
    /// Opens the library, resolves the manifest and checks the ABI version.
    static Result<std::shared_ptr<PluginUnit>, Error> Open(
        const std::filesystem::path& path);

    ~PluginUnit();

    PluginUnit(const PluginUnit&) = delete;
    PluginUnit& operator=(const PluginUnit&) = delete;

    [[nodiscard]] const std::string& Name() const noexcept { return name_; }
    [[nodiscard]] const std::filesystem::path& Path() const noexcept { return path_; }
    [[nodiscard]] const PluginManifest& Manifest() const noexcept { return *manifest_; }

    /// Stores a context for the unit's lifetime and returns a stable pointer.
    const PluginContext* AdoptContext(PluginContext context);

private:
    PluginUnit(void* handle, std::filesystem::path path,
               const PluginManifest* manifest);

    void* handle_;
    std::filesystem::path path_;
    const PluginManifest* manifest_;
    std::string name_;
    std::deque<PluginContext> contexts_;
};

/// True when the host accepts a plugin built against `plugin_abi`.
bool IsAbiCompatible(uint32_t plugin_abi);

// ---------------------------------------------------------------------------
// PluginLoader — discovers tools in a directory of shared objects.
//
// A corrupt library, a missing entry point, an ABI mismatch, a type without
// a usable factory or a throwing constructor is logged and skipped; it never
// stops discovery of the remaining plugins.
// ---------------------------------------------------------------------------
class PluginLoader {
public:
    PluginLoader(std::filesystem::path directory,
                 std::map<std::string, std::string> settings);

    /// Loads every plugin in the directory. Order follows file names, then
    /// the manifest's factory order.
    [[nodiscard]] std::vector<std::shared_ptr<ITool>> LoadPlugins();

    /// Candidate shared objects in the directory, sorted by file name.
    [[nodiscard]] static std::vector<std::filesystem::path> EnumerateCandidates(
        const std::filesystem::path& directory);

private:
    std::vector<std::shared_ptr<ITool>> LoadUnit(
        const std::filesystem::path& path);
    std::shared_ptr<ITool> Instantiate(const std::shared_ptr<PluginUnit>& unit,
                                       const ToolFactory& factory);
    PluginContext BuildContext(const std::string& plugin_name) const;

    std::filesystem::path directory_;
    std::map<std::string, std::string> settings_;
};

} // namespace mcp_host
