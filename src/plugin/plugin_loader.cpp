#include <mcp_host/plugin/plugin_loader.hpp>

#include <mcp_host/core/log.hpp>

#include <dlfcn.h>

#include <algorithm>
#include <exception>
#include <system_error>

namespace mcp_host {

namespace {

constexpr const char* kComponent = "plugins";

#if defined(__APPLE__)
constexpr const char* kLibraryExtension = ".dylib";
#else
constexpr const char* kLibraryExtension = ".so";
#endif

std::string LastDlError() {
    const char* message = dlerror();
    return message != nullptr ? message : "unknown dynamic loader error";
}

Error MakeLoadError(const std::filesystem::path& path, const std::string& message) {
    return Error::Make("PluginLoad", message, ErrorCategory::PluginLoad,
                       path.filename().string());
}

} // anonymous namespace

bool IsAbiCompatible(uint32_t plugin_abi) {
    const uint32_t plugin_major = (plugin_abi >> 16) & 0xFFFFu;
    const uint32_t plugin_minor = plugin_abi & 0xFFFFu;
    return plugin_major == MCP_HOST_PLUGIN_ABI_MAJOR &&
           plugin_minor <= MCP_HOST_PLUGIN_ABI_MINOR;
}

// ---------------------------------------------------------------------------
// PluginUnit
// ---------------------------------------------------------------------------
PluginUnit::PluginUnit(void* handle, std::filesystem::path path,
                       const PluginManifest* manifest)
    : handle_(handle),
      path_(std::move(path)),
      manifest_(manifest),
      name_(manifest->plugin_name != nullptr && manifest->plugin_name[0] != '\0'
                ? manifest->plugin_name
                : path_.stem().string()) {}

PluginUnit::~PluginUnit() {
    contexts_.clear();
    if (handle_ != nullptr) {
        dlclose(handle_);
    }
}

Result<std::shared_ptr<PluginUnit>, Error> PluginUnit::Open(
    const std::filesystem::path& path) {
    using R = Result<std::shared_ptr<PluginUnit>, Error>;

    dlerror();
    void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (handle == nullptr) {
        return R::Err(MakeLoadError(path, "dlopen failed: " + LastDlError()));
    }

    dlerror();
    auto entry = reinterpret_cast<PluginManifestFn>(
        dlsym(handle, kPluginEntryPoint));
    if (entry == nullptr) {
        auto message = std::string("missing entry point '") + kPluginEntryPoint +
                       "': " + LastDlError();
        dlclose(handle);
        return R::Err(MakeLoadError(path, message));
    }

    const PluginManifest* manifest = nullptr;
    try {
        manifest = entry();
    } catch (const std::exception& e) {
        dlclose(handle);
        return R::Err(MakeLoadError(path, std::string("manifest threw: ") + e.what()));
    }
    if (manifest == nullptr) {
        dlclose(handle);
        return R::Err(MakeLoadError(path, "manifest entry point returned null"));
    }

    if (!IsAbiCompatible(manifest->abi_version)) {
        auto message = "ABI mismatch: host " +
                       std::to_string(MCP_HOST_PLUGIN_ABI_MAJOR) + "." +
                       std::to_string(MCP_HOST_PLUGIN_ABI_MINOR) + " vs plugin " +
                       std::to_string((manifest->abi_version >> 16) & 0xFFFFu) +
                       "." + std::to_string(manifest->abi_version & 0xFFFFu);
        dlclose(handle);
        return R::Err(MakeLoadError(path, message));
    }

    if (manifest->factory_count > 0 && manifest->factories == nullptr) {
        dlclose(handle);
        return R::Err(MakeLoadError(path, "manifest lists factories but the table is null"));
    }

    return R::Ok(std::shared_ptr<PluginUnit>(
        new PluginUnit(handle, path, manifest)));
}

const PluginContext* PluginUnit::AdoptContext(PluginContext context) {
    contexts_.push_back(std::move(context));
    return &contexts_.back();
}

// ---------------------------------------------------------------------------
// PluginLoader
// ---------------------------------------------------------------------------
PluginLoader::PluginLoader(std::filesystem::path directory,
                           std::map<std::string, std::string> settings)
    : directory_(std::move(directory)), settings_(std::move(settings)) {}

std::vector<std::filesystem::path> PluginLoader::EnumerateCandidates(
    const std::filesystem::path& directory) {
    std::vector<std::filesystem::path> candidates;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(directory, ec), end;
         !ec && it != end; it.increment(ec)) {
        std::error_code status_ec;
        if (!it->is_regular_file(status_ec)) {
            continue;
        }
        if (it->path().extension() == kLibraryExtension) {
            candidates.push_back(it->path());
        }
    }
    std::sort(candidates.begin(), candidates.end(),
              [](const auto& a, const auto& b) {
                  return a.filename().string() < b.filename().string();
              });
    return candidates;
}

std::vector<std::shared_ptr<ITool>> PluginLoader::LoadPlugins() {
    std::vector<std::shared_ptr<ITool>> tools;

    std::error_code ec;
    if (!std::filesystem::is_directory(directory_, ec)) {
        LogInfo(kComponent, "Plugins directory not found, no plugins loaded: " +
                                directory_.string());
        return tools;
    }

    auto candidates = EnumerateCandidates(directory_);
    if (candidates.empty()) {
        LogInfo(kComponent, "Plugins directory is empty, no plugins loaded: " +
                                directory_.string());
        return tools;
    }

    LogInfo(kComponent, "Found " + std::to_string(candidates.size()) +
                            " plugin librar" +
                            (candidates.size() == 1 ? "y" : "ies") + " in " +
                            directory_.string());

    for (const auto& path : candidates) {
        auto unit_tools = LoadUnit(path);
        tools.insert(tools.end(),
                     std::make_move_iterator(unit_tools.begin()),
                     std::make_move_iterator(unit_tools.end()));
    }
    return tools;
}

std::vector<std::shared_ptr<ITool>> PluginLoader::LoadUnit(
    const std::filesystem::path& path) {
    std::vector<std::shared_ptr<ITool>> tools;

    auto opened = PluginUnit::Open(path);
    if (opened.IsErr()) {
        LogError(kComponent, "Skipping plugin: " + opened.Error().ToString());
        return tools;
    }
    auto unit = std::move(opened).Value();

    const auto& manifest = unit->Manifest();
    if (manifest.factory_count == 0) {
        LogInfo(kComponent, "No tool types exported by plugin " +
                                path.filename().string());
        return tools;
    }

    for (std::size_t i = 0; i < manifest.factory_count; ++i) {
        auto tool = Instantiate(unit, manifest.factories[i]);
        if (tool) {
            tools.push_back(std::move(tool));
        }
    }
    return tools;
}

std::shared_ptr<ITool> PluginLoader::Instantiate(
    const std::shared_ptr<PluginUnit>& unit, const ToolFactory& factory) {
    const std::string type_name =
        factory.type_name != nullptr ? factory.type_name : "<unnamed>";
    const std::string origin = type_name + " from " + unit->Path().filename().string();

    if (factory.create_with_context == nullptr && factory.create == nullptr) {
        LogWarn(kComponent, "Plugin type " + origin +
                                " has no supported constructor. Expected a default "
                                "constructor or one taking const PluginContext&. Skipping.");
        return nullptr;
    }

    ITool* raw = nullptr;
    try {
        if (factory.create_with_context != nullptr) {
            const auto* context = unit->AdoptContext(BuildContext(unit->Name()));
            raw = factory.create_with_context(context);
        } else {
            raw = factory.create();
        }
    } catch (const std::exception& e) {
        LogError(kComponent, "Failed to instantiate plugin type " + origin + ": " + e.what());
        return nullptr;
    } catch (...) {
        LogError(kComponent, "Failed to instantiate plugin type " + origin +
                                 ": non-standard exception");
        return nullptr;
    }

    if (raw == nullptr) {
        LogError(kComponent, "Factory for plugin type " + origin + " returned null");
        return nullptr;
    }

    // The deleter keeps the unit (and so the mapped code) alive until the
    // instance is destroyed.
    std::shared_ptr<ITool> tool(raw, [unit](ITool* t) { delete t; });

    std::string tool_name;
    try {
        tool_name = tool->Name();
    } catch (const std::exception& e) {
        LogError(kComponent, "Plugin type " + origin + " failed to report its name: " + e.what());
        return nullptr;
    }

    LogInfo(kComponent, "Loaded plugin tool '" + tool_name + "' (" + origin + ")");
    return tool;
}

PluginContext PluginLoader::BuildContext(const std::string& plugin_name) const {
    auto settings = settings_;
    ConfigLookup lookup = [settings](const std::string& key) -> std::optional<std::string> {
        auto it = settings.find(key);
        if (it == settings.end()) {
            return std::nullopt;
        }
        return it->second;
    };
    const std::string component = "plugin:" + plugin_name;
    DiagnosticSink sink = [component](LogLevel level, std::string_view message) {
        GlobalLogger().Log(level, component, message);
    };
    return PluginContext(plugin_name, std::move(lookup), std::move(sink));
}

} // namespace mcp_host
