#pragma once

#include <mcp_host/core/result.hpp>

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_host {

struct PromptArgument {
    std::string name;
    std::string description;
    bool required = false;
};

struct PromptDescriptor {
    std::string name;
    std::string description;
    std::vector<PromptArgument> arguments;
};

void to_json(nlohmann::json& j, const PromptDescriptor& prompt);

using PromptArguments = std::map<std::string, std::string>;

class IPromptProvider {
public:
    virtual ~IPromptProvider() = default;

    [[nodiscard]] virtual bool CanHandle(const std::string& name) const = 0;
    [[nodiscard]] virtual std::vector<PromptDescriptor> ListPrompts() const = 0;

    /// prompts/get result: {description, messages}. A missing required
    /// argument is an InvalidArgument error.
    [[nodiscard]] virtual Result<nlohmann::json, Error> GetPrompt(
        const std::string& name, const PromptArguments& arguments) const = 0;
};

// Parameterized templates for the common tool workflows.
class BuiltInPromptProvider : public IPromptProvider {
public:
    BuiltInPromptProvider();

    [[nodiscard]] bool CanHandle(const std::string& name) const override;
    [[nodiscard]] std::vector<PromptDescriptor> ListPrompts() const override;
    [[nodiscard]] Result<nlohmann::json, Error> GetPrompt(
        const std::string& name, const PromptArguments& arguments) const override;

private:
    std::vector<PromptDescriptor> prompts_;
};

} // namespace mcp_host
