#pragma once

#include <mcp_host/plugin/tool.hpp>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_host {

enum class ToolOrigin {
    BuiltIn,
    Plugin,
};

const char* ToolOriginName(ToolOrigin origin);

// A built-in handler: arguments in, result out.
using ToolHandler = std::function<ToolCallResult(
    const nlohmann::json& arguments, IProgressReporter& progress,
    const CancellationToken& cancellation)>;

// ---------------------------------------------------------------------------
// FunctionTool — adapts a ToolHandler to the ITool contract.
// ---------------------------------------------------------------------------
class FunctionTool : public ITool {
public:
    FunctionTool(std::string name, std::string description,
                 nlohmann::json input_schema, ToolHandler handler);

    [[nodiscard]] std::string Name() const override { return name_; }
    [[nodiscard]] std::string Description() const override { return description_; }
    [[nodiscard]] nlohmann::json InputSchema() const override { return input_schema_; }

    ToolCallResult Execute(const nlohmann::json& arguments,
                           IProgressReporter& progress,
                           const CancellationToken& cancellation) override;

private:
    std::string name_;
    std::string description_;
    nlohmann::json input_schema_;
    ToolHandler handler_;
};

// ---------------------------------------------------------------------------
// ToolRegistry — registry of MCP tools, built once at startup.
//
// The first tool registered under a name wins; later duplicates are rejected
// with a warning and never listed. Built-ins are registered before plugins.
// Not synchronized: populate before serving, then only read.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    /// Returns false when the tool was rejected (null, unnamed, duplicate or
    /// failed to describe itself).
    bool Register(std::shared_ptr<ITool> tool,
                  ToolOrigin origin = ToolOrigin::BuiltIn);

    bool Register(const std::string& name,
                  const std::string& description,
                  const nlohmann::json& input_schema,
                  ToolHandler handler);

    /// Registers each tool in order. Returns the number accepted.
    std::size_t RegisterAll(const std::vector<std::shared_ptr<ITool>>& tools,
                            ToolOrigin origin);

    /// Descriptors in registration order.
    [[nodiscard]] const std::vector<ToolDescriptor>& Tools() const noexcept {
        return descriptors_;
    }

    [[nodiscard]] std::size_t Size() const noexcept { return descriptors_.size(); }

    [[nodiscard]] bool HasTool(const std::string& name) const;

    [[nodiscard]] std::shared_ptr<ITool> Find(const std::string& name) const;

    [[nodiscard]] std::optional<ToolOrigin> OriginOf(const std::string& name) const;

private:
    struct Entry {
        std::shared_ptr<ITool> tool;
        ToolOrigin origin;
    };

    std::vector<ToolDescriptor> descriptors_;
    std::map<std::string, Entry> tools_;
};

} // namespace mcp_host
