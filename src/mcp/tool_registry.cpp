#include <mcp_host/mcp/tool_registry.hpp>

#include <mcp_host/core/log.hpp>

#include <exception>

namespace mcp_host {

namespace {
constexpr const char* kComponent = "registry";
} // anonymous namespace

const char* ToolOriginName(ToolOrigin origin) {
    switch (origin) {
        case ToolOrigin::BuiltIn: return "built-in";
        case ToolOrigin::Plugin:  return "plugin";
    }
    return "unknown";
}

FunctionTool::FunctionTool(std::string name, std::string description,
                           nlohmann::json input_schema, ToolHandler handler)
    : name_(std::move(name)),
      description_(std::move(description)),
      input_schema_(std::move(input_schema)),
      handler_(std::move(handler)) {}

ToolCallResult FunctionTool::Execute(const nlohmann::json& arguments,
                                     IProgressReporter& progress,
                                     const CancellationToken& cancellation) {
    if (!handler_) {
        return ToolCallResult::Failure("Tool '" + name_ + "' has no handler");
    }
    return handler_(arguments, progress, cancellation);
}

bool ToolRegistry::Register(std::shared_ptr<ITool> tool, ToolOrigin origin) {
    if (!tool) {
        LogWarn(kComponent, "Ignoring null tool instance");
        return false;
    }

    ToolDescriptor descriptor;
    try {
        descriptor = tool->Describe();
    } catch (const std::exception& e) {
        LogError(kComponent, std::string("Tool failed to describe itself: ") + e.what());
        return false;
    }

    if (descriptor.name.empty()) {
        LogWarn(kComponent, "Ignoring tool with an empty name");
        return false;
    }
    if (descriptor.input_schema.is_null()) {
        descriptor.input_schema = {{"type", "object"},
                                   {"properties", nlohmann::json::object()}};
    }

    auto existing = tools_.find(descriptor.name);
    if (existing != tools_.end()) {
        LogWarn(kComponent, "Duplicate tool name '" + descriptor.name + "' from " +
                                ToolOriginName(origin) + " ignored; the " +
                                ToolOriginName(existing->second.origin) +
                                " tool registered first is kept");
        return false;
    }

    LogDebug(kComponent, "Registered " + std::string(ToolOriginName(origin)) +
                             " tool '" + descriptor.name + "'");
    tools_.emplace(descriptor.name, Entry{std::move(tool), origin});
    descriptors_.push_back(std::move(descriptor));
    return true;
}

bool ToolRegistry::Register(const std::string& name,
                            const std::string& description,
                            const nlohmann::json& input_schema,
                            ToolHandler handler) {
    return Register(std::make_shared<FunctionTool>(name, description,
                                                   input_schema,
                                                   std::move(handler)),
                    ToolOrigin::BuiltIn);
}

std::size_t ToolRegistry::RegisterAll(
    const std::vector<std::shared_ptr<ITool>>& tools, ToolOrigin origin) {
    std::size_t accepted = 0;
    for (const auto& tool : tools) {
        if (Register(tool, origin)) {
            ++accepted;
        }
    }
    return accepted;
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return tools_.count(name) > 0;
}

std::shared_ptr<ITool> ToolRegistry::Find(const std::string& name) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return nullptr;
    }
    return it->second.tool;
}

std::optional<ToolOrigin> ToolRegistry::OriginOf(const std::string& name) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return std::nullopt;
    }
    return it->second.origin;
}

} // namespace mcp_host
