// Sample plugin. Build it with the host, then copy greeting_plugin.so into
// the plugins directory; "greet" appears in tools/list after a restart.
//
// plugins:
//   settings:
//     greeting: { prefix: Hey }

#include <mcp_host/plugin/plugin_abi.hpp>

#include <algorithm>
#include <cctype>
#include <string>

namespace {

using mcp_host::CancellationToken;
using mcp_host::IProgressReporter;
using mcp_host::PluginContext;
using mcp_host::ToolCallResult;

nlohmann::json GreetSchema() {
    return {{"type", "object"},
            {"properties",
             {{"action", {{"type", "string"},
                          {"description", "The action to perform"},
                          {"enum", {"greet"}}}},
              {"name", {{"type", "string"}, {"description", "The name to greet"}}}}},
            {"required", {"name"}}};
}

std::string NameArg(const nlohmann::json& args) {
    if (args.contains("name") && args["name"].is_string()) {
        return args["name"].get<std::string>();
    }
    return {};
}

bool IsBlank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

bool IsGreetAction(const nlohmann::json& args) {
    if (!args.contains("action")) {
        return true;
    }
    if (!args["action"].is_string()) {
        return false;
    }
    auto action = args["action"].get<std::string>();
    std::transform(action.begin(), action.end(), action.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return action == "greet";
}

class GreetingTool : public mcp_host::ITool {
public:
    explicit GreetingTool(const PluginContext& context)
        : prefix_(context.GetConfig("prefix").value_or("Hello")) {
        context.LogInfo("greeting prefix is '" + prefix_ + "'");
    }

    std::string Name() const override { return "greet"; }
    std::string Description() const override {
        return "Returns a personalised greeting. Action: 'greet' (required param: name).";
    }
    nlohmann::json InputSchema() const override { return GreetSchema(); }

    ToolCallResult Execute(const nlohmann::json& args, IProgressReporter& progress,
                           const CancellationToken& cancellation) override {
        if (!IsGreetAction(args)) {
            return ToolCallResult::Failure("Unknown action. Supported: greet");
        }
        auto name = NameArg(args);
        if (IsBlank(name)) {
            return ToolCallResult::Failure("'name' parameter is required.");
        }

        progress.Report(0, 2);
        if (cancellation.IsCancelled()) {
            return ToolCallResult::Failure("Cancelled.");
        }
        auto text = prefix_ + ", " + name + "!";
        progress.Report(2, 2);
        return ToolCallResult::Success(text);
    }

private:
    std::string prefix_;
};

} // anonymous namespace

MCP_HOST_DECLARE_PLUGIN("greeting", MCP_HOST_TOOL(GreetingTool))
