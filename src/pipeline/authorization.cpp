#include <mcp_host/pipeline/authorization.hpp>

#include <mcp_host/core/log.hpp>
#include <mcp_host/core/strings.hpp>

#include <algorithm>
#include <cctype>

namespace mcp_host {

namespace {

constexpr const char* kComponent = "auth";
constexpr const char* kDeniedName = "__denied__";

bool IsToolAllowed(const std::vector<std::string>& allowed_tools,
                   const std::string& tool_name) {
    return std::any_of(allowed_tools.begin(), allowed_tools.end(),
                       [&](const std::string& entry) {
                           return entry == "*" || EqualsIgnoreCase(entry, tool_name);
                       });
}

bool IsActionAllowed(const std::map<std::string, std::vector<std::string>>& allowed_actions,
                     const std::string& tool_name, const std::string& action) {
    for (const auto& [tool, actions] : allowed_actions) {
        if (!EqualsIgnoreCase(tool, tool_name)) {
            continue;
        }
        return std::any_of(actions.begin(), actions.end(),
                           [&](const std::string& a) { return EqualsIgnoreCase(a, action); });
    }
    return true;
}

} // anonymous namespace

Identity Identity::Denied() {
    Identity identity;
    identity.name = kDeniedName;
    identity.denied = true;
    return identity;
}

ApiKeyAuthorizationService::ApiKeyAuthorizationService(AuthSettings settings)
    : settings_(std::move(settings)) {}

std::optional<Identity> ApiKeyAuthorizationService::ResolveIdentity(
    const std::optional<std::string>& credential) const {
    const bool blank = !credential ||
        std::all_of(credential->begin(), credential->end(),
                    [](unsigned char c) { return std::isspace(c) != 0; });
    if (blank) {
        if (!settings_.require_authentication) {
            return std::nullopt;
        }
        LogWarn(kComponent, "No API key provided but authentication is required");
        return Identity::Denied();
    }

    auto it = settings_.api_keys.find(*credential);
    if (it == settings_.api_keys.end()) {
        LogWarn(kComponent, "Unrecognized API key presented");
        return Identity::Denied();
    }

    Identity identity;
    identity.name = it->second.name;
    identity.allowed_tools = it->second.allowed_tools;
    identity.allowed_actions = it->second.allowed_actions;
    LogInfo(kComponent, "Authenticated as '" + identity.name + "'");
    return identity;
}

AuthorizationDecision ApiKeyAuthorizationService::Authorize(
    const std::optional<Identity>& identity, const std::string& tool_name,
    const std::optional<std::string>& action) const {
    if (!identity) {
        if (settings_.require_authentication) {
            return AuthorizationDecision::Deny(
                "Authentication required. No valid API key was provided.");
        }
        return AuthorizationDecision::Allow();
    }

    if (identity->denied) {
        return AuthorizationDecision::Deny(
            "Authentication required. No valid API key was provided.");
    }

    if (!IsToolAllowed(identity->allowed_tools, tool_name)) {
        return AuthorizationDecision::Deny("Unauthorized: API key '" + identity->name +
                                           "' does not have access to tool '" +
                                           tool_name + "'.");
    }

    if (action && !IsActionAllowed(identity->allowed_actions, tool_name, *action)) {
        return AuthorizationDecision::Deny("Unauthorized: API key '" + identity->name +
                                           "' does not have access to action '" + *action +
                                           "' on tool '" + tool_name + "'.");
    }

    return AuthorizationDecision::Allow();
}

} // namespace mcp_host
