#include <catch2/catch_test_macros.hpp>

#include <mcp_host/pipeline/authorization.hpp>

#include <string>

using namespace mcp_host;

namespace {

AuthSettings TwoKeys(bool required) {
    AuthSettings s;
    s.require_authentication = required;
    s.api_keys["admin-key"] = ApiKeyEntry{"admin", {"*"}, {}};
    s.api_keys["reader-key"] = ApiKeyEntry{
        "reader", {"Text", "datetime"}, {{"text", {"word_count", "FORMAT_JSON"}}}};
    return s;
}

} // namespace

TEST_CASE("ResolveIdentity: known key maps to its permissions", "[pipeline][auth]") {
    ApiKeyAuthorizationService auth(TwoKeys(true));

    auto id = auth.ResolveIdentity(std::string("reader-key"));
    REQUIRE(id.has_value());
    CHECK(id->name == "reader");
    CHECK_FALSE(id->denied);
    CHECK(id->allowed_tools.size() == 2);
}

TEST_CASE("ResolveIdentity: keys are case-sensitive", "[pipeline][auth]") {
    ApiKeyAuthorizationService auth(TwoKeys(false));
    auto id = auth.ResolveIdentity(std::string("ADMIN-KEY"));
    REQUIRE(id.has_value());
    CHECK(id->denied);
}

TEST_CASE("ResolveIdentity: blank credential depends on require_authentication", "[pipeline][auth]") {
    ApiKeyAuthorizationService optional_auth(TwoKeys(false));
    CHECK_FALSE(optional_auth.ResolveIdentity(std::nullopt).has_value());
    CHECK_FALSE(optional_auth.ResolveIdentity(std::string("   ")).has_value());

    ApiKeyAuthorizationService required_auth(TwoKeys(true));
    auto id = required_auth.ResolveIdentity(std::nullopt);
    REQUIRE(id.has_value());
    CHECK(id->denied);
}

TEST_CASE("Authorize: anonymous is allowed only when authentication is optional", "[pipeline][auth]") {
    ApiKeyAuthorizationService optional_auth(TwoKeys(false));
    CHECK(optional_auth.Authorize(std::nullopt, "text", std::nullopt).allowed);

    ApiKeyAuthorizationService required_auth(TwoKeys(true));
    auto decision = required_auth.Authorize(std::nullopt, "text", std::nullopt);
    CHECK_FALSE(decision.allowed);
    REQUIRE(decision.reason.has_value());
    CHECK(decision.reason->find("Authentication required") != std::string::npos);
}

TEST_CASE("Authorize: denied identity is refused every tool", "[pipeline][auth]") {
    ApiKeyAuthorizationService auth(TwoKeys(false));
    CHECK_FALSE(auth.Authorize(Identity::Denied(), "text", std::nullopt).allowed);
}

TEST_CASE("Authorize: wildcard grants every tool and action", "[pipeline][auth]") {
    ApiKeyAuthorizationService auth(TwoKeys(true));
    auto admin = auth.ResolveIdentity(std::string("admin-key"));
    CHECK(auth.Authorize(admin, "anything", std::string("delete")).allowed);
}

TEST_CASE("Authorize: tool allow-list matches case-insensitively", "[pipeline][auth]") {
    ApiKeyAuthorizationService auth(TwoKeys(true));
    auto reader = auth.ResolveIdentity(std::string("reader-key"));

    CHECK(auth.Authorize(reader, "TEXT", std::string("word_count")).allowed);
    CHECK(auth.Authorize(reader, "DateTime", std::nullopt).allowed);

    auto denied = auth.Authorize(reader, "environment", std::nullopt);
    CHECK_FALSE(denied.allowed);
    CHECK(*denied.reason ==
          "Unauthorized: API key 'reader' does not have access to tool 'environment'.");
}

TEST_CASE("Authorize: action allow-list applies only to tools that have one", "[pipeline][auth]") {
    ApiKeyAuthorizationService auth(TwoKeys(true));
    auto reader = auth.ResolveIdentity(std::string("reader-key"));

    CHECK(auth.Authorize(reader, "text", std::string("format_json")).allowed);

    auto denied = auth.Authorize(reader, "text", std::string("regex_replace"));
    CHECK_FALSE(denied.allowed);
    CHECK(denied.reason->find("action 'regex_replace'") != std::string::npos);

    // No action given: only the tool is checked.
    CHECK(auth.Authorize(reader, "text", std::nullopt).allowed);
    // datetime has no actions entry: every action is allowed.
    CHECK(auth.Authorize(reader, "datetime", std::string("to_unix")).allowed);
}

TEST_CASE("NullAuthorizationService: everyone is anonymous and allowed", "[pipeline][auth]") {
    NullAuthorizationService auth;
    CHECK_FALSE(auth.ResolveIdentity(std::string("whatever")).has_value());
    CHECK(auth.Authorize(Identity::Denied(), "text", std::nullopt).allowed);
}
