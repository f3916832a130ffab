#include <catch2/catch_test_macros.hpp>

#include <mcp_host/core/base64.hpp>
#include <mcp_host/core/strings.hpp>

#include <string>

using namespace mcp_host;

TEST_CASE("ToLower: lower-cases ASCII only", "[core][strings]") {
    CHECK(ToLower("File_System") == "file_system");
    CHECK(ToLower("") == "");
    CHECK(ToLower("ABC-123") == "abc-123");
}

TEST_CASE("EqualsIgnoreCase: compares ASCII case-insensitively", "[core][strings]") {
    CHECK(EqualsIgnoreCase("ApiKey", "apikey"));
    CHECK(EqualsIgnoreCase("", ""));
    CHECK_FALSE(EqualsIgnoreCase("token", "tokens"));
    CHECK_FALSE(EqualsIgnoreCase("a", "b"));
}

TEST_CASE("EncodeBase64: RFC 4648 test vectors", "[core][base64]") {
    CHECK(EncodeBase64("") == "");
    CHECK(EncodeBase64("f") == "Zg==");
    CHECK(EncodeBase64("fo") == "Zm8=");
    CHECK(EncodeBase64("foo") == "Zm9v");
    CHECK(EncodeBase64("foob") == "Zm9vYg==");
    CHECK(EncodeBase64("fooba") == "Zm9vYmE=");
    CHECK(EncodeBase64("foobar") == "Zm9vYmFy");
    CHECK(EncodeBase64(std::string("\xff\x00\x10", 3)) == "/wAQ");
}
