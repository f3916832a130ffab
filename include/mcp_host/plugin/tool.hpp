#pragma once

#include <mcp_host/plugin/cancellation.hpp>
#include <mcp_host/plugin/progress.hpp>
#include <mcp_host/plugin/tool_result.hpp>

#include <string>

#include <nlohmann/json.hpp>

namespace mcp_host {

// ---------------------------------------------------------------------------
// ToolDescriptor — what tools/list advertises for one tool.
// ---------------------------------------------------------------------------
struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object
};

// ---------------------------------------------------------------------------
// ITool — the contract shared by built-in and plugin tools.
//
// Execute() may be called from several worker threads at once. Report
// failures through ToolCallResult::Failure(); an escaping exception is
// caught by the host and turned into a generic error result.
// ---------------------------------------------------------------------------
class ITool {
public:
    virtual ~ITool() = default;

    [[nodiscard]] virtual std::string Name() const = 0;
    [[nodiscard]] virtual std::string Description() const = 0;
    [[nodiscard]] virtual nlohmann::json InputSchema() const = 0;

    virtual ToolCallResult Execute(const nlohmann::json& arguments,
                                   IProgressReporter& progress,
                                   const CancellationToken& cancellation) = 0;

    [[nodiscard]] ToolDescriptor Describe() const;
};

} // namespace mcp_host
