#include <catch2/catch_test_macros.hpp>

#include <mcp_host/mcp/builtin_tools.hpp>

#include <cstdlib>
#include <string>

using namespace mcp_host;

namespace {

ToolRegistry& Registry() {
    static ToolRegistry registry = [] {
        ToolRegistry r;
        RegisterBuiltInTools(r);
        return r;
    }();
    return registry;
}

ToolCallResult Call(const std::string& tool, const nlohmann::json& args) {
    auto found = Registry().Find(tool);
    REQUIRE(found);
    return found->Execute(args, NullProgressReporter::Instance(), CancellationToken());
}

bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // anonymous namespace

TEST_CASE("RegisterBuiltInTools: registers text, datetime and environment", "[mcp][builtin]") {
    ToolRegistry registry;
    CHECK(RegisterBuiltInTools(registry) == 3);
    REQUIRE(registry.Size() == 3);
    CHECK(registry.Tools()[0].name == "text");
    CHECK(registry.Tools()[1].name == "datetime");
    CHECK(registry.Tools()[2].name == "environment");
    for (const auto& tool : registry.Tools()) {
        CHECK(tool.input_schema["type"] == "object");
        CHECK(tool.input_schema["properties"].contains("action"));
    }

    // Registering twice adds nothing.
    CHECK(RegisterBuiltInTools(registry) == 0);
}

// ===========================================================================
// text
// ===========================================================================

TEST_CASE("text: regex_match lists matches and groups", "[mcp][builtin][text]") {
    auto result = Call("text", {{"action", "regex_match"},
                                {"pattern", "(\\d+)-(\\d+)"},
                                {"text", "a 10-20 b 3-4"}});
    CHECK_FALSE(result.is_error);
    auto text = result.FirstText();
    CHECK(Contains(text, "Found 2 match(es):"));
    CHECK(Contains(text, "Match 1: \"10-20\" (position 2)"));
    CHECK(Contains(text, "  Group 2: \"4\""));

    auto none = Call("text", {{"action", "regex_match"}, {"pattern", "z+"}, {"text", "abc"}});
    CHECK(none.FirstText() == "No matches found.");
}

TEST_CASE("text: regex_replace counts replacements", "[mcp][builtin][text]") {
    auto result = Call("text", {{"action", "regex_replace"},
                                {"pattern", "o"},
                                {"replacement", "0"},
                                {"text", "foo boo"}});
    CHECK(result.FirstText() == "Replacements made: 4\n\n--- Result ---\nf00 b00");

    auto missing = Call("text", {{"action", "regex_replace"}, {"pattern", "o"},
                                 {"text", "foo"}});
    CHECK(missing.is_error);
}

TEST_CASE("text: invalid regex is reported, not thrown", "[mcp][builtin][text]") {
    auto result = Call("text", {{"action", "regex_match"}, {"pattern", "(unclosed"},
                                {"text", "x"}});
    CHECK(result.is_error);
    CHECK(Contains(result.FirstText(), "Error: Invalid regex:"));
}

TEST_CASE("text: word_count statistics", "[mcp][builtin][text]") {
    auto result = Call("text", {{"action", "word_count"},
                                {"text", "Hello world. How are you?\nFine!"}});
    auto text = result.FirstText();
    CHECK(Contains(text, "Words: 6"));
    CHECK(Contains(text, "Lines: 2"));
    CHECK(Contains(text, "Sentences: 3"));
}

TEST_CASE("text: format_json pretty-prints or rejects", "[mcp][builtin][text]") {
    auto ok = Call("text", {{"action", "format_json"}, {"text", R"({"b":1,"a":[1,2]})"}});
    CHECK_FALSE(ok.is_error);
    CHECK(ok.FirstText() == nlohmann::json::parse(R"({"a":[1,2],"b":1})").dump(2));

    auto bad = Call("text", {{"action", "format_json"}, {"text", "{nope"}});
    CHECK(bad.is_error);
    CHECK(bad.FirstText() == "Error: Input is not valid JSON.");
}

TEST_CASE("text: base64_encode", "[mcp][builtin][text]") {
    CHECK(Call("text", {{"action", "base64_encode"}, {"text", "foobar"}}).FirstText() ==
          "Zm9vYmFy");
}

TEST_CASE("text: oversized input and unknown action", "[mcp][builtin][text]") {
    auto big = Call("text", {{"action", "word_count"},
                             {"text", std::string(1024 * 1024 + 1, 'a')}});
    CHECK(big.is_error);
    CHECK(Contains(big.FirstText(), "exceeds maximum size of 1024KB"));

    auto unknown = Call("text", {{"action", "shout"}, {"text", "x"}});
    CHECK(unknown.is_error);
    CHECK(Contains(unknown.FirstText(), "Unknown action: shout"));

    auto missing = Call("text", {{"action", "WORD_COUNT"}});
    CHECK(missing.FirstText() == "Error: 'text' parameter is required.");
}

// ===========================================================================
// datetime
// ===========================================================================

TEST_CASE("datetime: now returns UTC and unix seconds", "[mcp][builtin][datetime]") {
    auto result = Call("datetime", {{"action", "now"}});
    REQUIRE_FALSE(result.is_error);
    auto parsed = nlohmann::json::parse(result.FirstText());
    CHECK(parsed["utc"].get<std::string>().back() == 'Z');
    CHECK(parsed["unix"].get<long long>() > 1700000000LL);
}

TEST_CASE("datetime: converts between ISO 8601 and unix", "[mcp][builtin][datetime]") {
    CHECK(Call("datetime", {{"action", "to_unix"},
                            {"datetime", "2024-01-15T10:30:00Z"}}).FirstText() ==
          "1705314600");
    CHECK(Call("datetime", {{"action", "to_unix"},
                            {"datetime", "2024-01-15T10:30:00"}}).FirstText() ==
          "1705314600");
    CHECK(Call("datetime", {{"action", "from_unix"},
                            {"timestamp", 1705314600}}).FirstText() ==
          "2024-01-15T10:30:00Z");
}

TEST_CASE("datetime: invalid input", "[mcp][builtin][datetime]") {
    CHECK(Call("datetime", {{"action", "to_unix"}, {"datetime", "yesterday"}}).is_error);
    CHECK(Call("datetime", {{"action", "to_unix"},
                            {"datetime", "2024-01-15T10:30:00+02"}}).is_error);
    CHECK(Call("datetime", {{"action", "from_unix"}, {"timestamp", "1"}}).is_error);
    CHECK(Call("datetime", {{"action", "tomorrow"}}).is_error);
}

// ===========================================================================
// environment
// ===========================================================================

TEST_CASE("environment: get, has and masking", "[mcp][builtin][environment]") {
    ::setenv("MCP_HOST_TEST_PLAIN", "visible", 1);
    ::setenv("MCP_HOST_TEST_TOKEN", "hunter2", 1);
    ::unsetenv("MCP_HOST_TEST_UNSET");

    CHECK(Call("environment", {{"action", "get"}, {"name", "MCP_HOST_TEST_PLAIN"}})
              .FirstText() == "MCP_HOST_TEST_PLAIN=visible");
    CHECK(Call("environment", {{"action", "get"}, {"name", "MCP_HOST_TEST_TOKEN"}})
              .FirstText() == "MCP_HOST_TEST_TOKEN=***");
    CHECK(Call("environment", {{"action", "get"}, {"name", "MCP_HOST_TEST_UNSET"}})
              .is_error);
    CHECK(Call("environment", {{"action", "has"}, {"name", "MCP_HOST_TEST_PLAIN"}})
              .FirstText() == "true");
    CHECK(Call("environment", {{"action", "has"}, {"name", "MCP_HOST_TEST_UNSET"}})
              .FirstText() == "false");
}

TEST_CASE("environment: list filters names, never values", "[mcp][builtin][environment]") {
    ::setenv("MCP_HOST_TEST_LIST_A", "value-a", 1);
    ::setenv("MCP_HOST_TEST_LIST_B", "value-b", 1);

    auto text = Call("environment", {{"action", "list"},
                                     {"filter", "mcp_host_test_list"}}).FirstText();
    CHECK(Contains(text, "2 variable(s):"));
    CHECK(Contains(text, "MCP_HOST_TEST_LIST_A"));
    CHECK_FALSE(Contains(text, "value-a"));
}
