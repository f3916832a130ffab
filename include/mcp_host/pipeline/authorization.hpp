#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mcp_host {

struct ApiKeyEntry {
    std::string name;
    std::vector<std::string> allowed_tools;                           // "*" = any
    std::map<std::string, std::vector<std::string>> allowed_actions;  // per tool
};

struct AuthSettings {
    bool require_authentication = false;
    std::string api_key_env = "MCP_HOST_API_KEY";
    std::map<std::string, ApiKeyEntry> api_keys;  // key -> permissions
};

// ---------------------------------------------------------------------------
// Identity — who is calling. An absent identity (nullopt) is an anonymous
// session; `denied` marks a missing or unknown key while authentication is
// required, and every call made under it is refused.
// ---------------------------------------------------------------------------
struct Identity {
    std::string name;
    std::vector<std::string> allowed_tools;
    std::map<std::string, std::vector<std::string>> allowed_actions;
    bool denied = false;

    static Identity Denied();
};

struct AuthorizationDecision {
    bool allowed = true;
    std::optional<std::string> reason;

    static AuthorizationDecision Allow() { return {true, std::nullopt}; }
    static AuthorizationDecision Deny(std::string why) { return {false, std::move(why)}; }
};

class IAuthorizationService {
public:
    virtual ~IAuthorizationService() = default;

    /// Maps a presented credential to an identity. Never logs the credential.
    virtual std::optional<Identity> ResolveIdentity(
        const std::optional<std::string>& credential) const = 0;

    virtual AuthorizationDecision Authorize(const std::optional<Identity>& identity,
                                            const std::string& tool_name,
                                            const std::optional<std::string>& action) const = 0;
};

// Everything is anonymous and allowed.
class NullAuthorizationService : public IAuthorizationService {
public:
    std::optional<Identity> ResolveIdentity(
        const std::optional<std::string>&) const override {
        return std::nullopt;
    }
    AuthorizationDecision Authorize(const std::optional<Identity>&, const std::string&,
                                    const std::optional<std::string>&) const override {
        return AuthorizationDecision::Allow();
    }
};

// ---------------------------------------------------------------------------
// ApiKeyAuthorizationService — static API key table from configuration.
//
// Keys are opaque and case-sensitive. Tool and action names match
// case-insensitively. A tool without an allowed_actions entry permits every
// action.
// ---------------------------------------------------------------------------
class ApiKeyAuthorizationService : public IAuthorizationService {
public:
    explicit ApiKeyAuthorizationService(AuthSettings settings);

    std::optional<Identity> ResolveIdentity(
        const std::optional<std::string>& credential) const override;

    AuthorizationDecision Authorize(const std::optional<Identity>& identity,
                                    const std::string& tool_name,
                                    const std::optional<std::string>& action) const override;

private:
    AuthSettings settings_;
};

} // namespace mcp_host
