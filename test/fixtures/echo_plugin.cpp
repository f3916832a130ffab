// Test fixture: a well-formed plugin with one default-constructed tool.

#include <mcp_host/plugin/plugin_abi.hpp>

#include <string>

namespace {

class EchoTool : public mcp_host::ITool {
public:
    std::string Name() const override { return "echo"; }
    std::string Description() const override { return "Echoes the 'text' argument."; }
    nlohmann::json InputSchema() const override {
        return {{"type", "object"},
                {"properties", {{"text", {{"type", "string"}}}}},
                {"required", {"text"}}};
    }

    mcp_host::ToolCallResult Execute(const nlohmann::json& args,
                                     mcp_host::IProgressReporter& progress,
                                     const mcp_host::CancellationToken&) override {
        progress.Report(1, 1);
        if (!args.contains("text") || !args["text"].is_string()) {
            return mcp_host::ToolCallResult::Failure("'text' is required.");
        }
        return mcp_host::ToolCallResult::Success(args["text"].get<std::string>());
    }
};

} // anonymous namespace

MCP_HOST_DECLARE_PLUGIN("echo", MCP_HOST_TOOL(EchoTool))
