#include <catch2/catch_test_macros.hpp>

#include <mcp_host/mcp/client_log_sink.hpp>
#include <mcp_host/mcp/output_channel.hpp>
#include <mcp_host/mcp/progress_notifier.hpp>

#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace mcp_host;

namespace {

std::vector<nlohmann::json> Lines(const std::string& text) {
    std::vector<nlohmann::json> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(nlohmann::json::parse(line));
    }
    return lines;
}

} // anonymous namespace

// ===========================================================================
// OutputChannel
// ===========================================================================

TEST_CASE("OutputChannel: writes one line per message in order", "[mcp][channel]") {
    std::ostringstream out;
    {
        OutputChannel channel(out);
        channel.Send({{"n", 1}});
        channel.Send({{"n", 2}, {"text", "multi\nline"}});
        channel.Flush();
    }
    auto lines = Lines(out.str());
    REQUIRE(lines.size() == 2);
    CHECK(lines[0]["n"] == 1);
    CHECK(lines[1]["text"] == "multi\nline");
}

TEST_CASE("OutputChannel: concurrent senders never interleave lines", "[mcp][channel]") {
    std::ostringstream out;
    OutputChannel channel(out);

    std::vector<std::thread> threads;
    for (int t = 0; t < 6; ++t) {
        threads.emplace_back([&channel, t] {
            for (int i = 0; i < 50; ++i) {
                channel.Send({{"thread", t}, {"i", i}, {"pad", std::string(64, 'x')}});
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    channel.Close();

    auto lines = Lines(out.str());
    CHECK(lines.size() == 300);
}

TEST_CASE("OutputChannel: messages after Close are dropped", "[mcp][channel]") {
    std::ostringstream out;
    OutputChannel channel(out);
    channel.Send({{"n", 1}});
    channel.Close();
    channel.Close();
    channel.Send({{"n", 2}});

    CHECK(channel.IsClosed());
    CHECK(Lines(out.str()).size() == 1);
}

// ===========================================================================
// ClientLogSink
// ===========================================================================

TEST_CASE("McpLogLevel: names round-trip and map from local levels", "[mcp][logging]") {
    CHECK(ParseMcpLogLevel("warning") == McpLogLevel::Warning);
    CHECK(ParseMcpLogLevel("EMERGENCY") == McpLogLevel::Emergency);
    CHECK_FALSE(ParseMcpLogLevel("warn").has_value());
    CHECK(std::string(McpLogLevelName(McpLogLevel::Notice)) == "notice");
    CHECK(ToMcpLogLevel(LogLevel::Warn) == McpLogLevel::Warning);
    CHECK(ToMcpLogLevel(LogLevel::Debug) == McpLogLevel::Debug);
}

TEST_CASE("ClientLogSink: forwards records at or above the client level", "[mcp][logging]") {
    std::ostringstream out;
    auto channel = std::make_shared<OutputChannel>(out);
    ClientLogSink sink;

    sink.Write(LogLevel::Error, "early", "dropped before attach");
    sink.Attach(channel);
    CHECK(sink.Level() == McpLogLevel::Warning);

    sink.Write(LogLevel::Info, "pipeline", "below warning");
    sink.Write(LogLevel::Warn, "pipeline", "rate limited");
    sink.SetLevel(McpLogLevel::Debug);
    sink.Write(LogLevel::Debug, "cache", "miss");
    sink.Detach();
    sink.Write(LogLevel::Error, "late", "dropped after detach");
    channel->Close();

    auto lines = Lines(out.str());
    REQUIRE(lines.size() == 2);
    CHECK(lines[0]["method"] == "notifications/message");
    CHECK(lines[0]["params"]["level"] == "warning");
    CHECK(lines[0]["params"]["logger"] == "pipeline");
    CHECK(lines[0]["params"]["data"] == "rate limited");
    CHECK(lines[1]["params"]["level"] == "debug");
    CHECK_FALSE(lines[0].contains("id"));
}

// ===========================================================================
// ProgressNotifier
// ===========================================================================

TEST_CASE("ProgressNotifier: emits progress notifications with the token", "[mcp][progress]") {
    std::ostringstream out;
    auto channel = std::make_shared<OutputChannel>(out);
    ProgressNotifier notifier("tok-1", channel);

    notifier.Report(1, 4);
    notifier.Report(0.5);
    channel->Close();

    auto lines = Lines(out.str());
    REQUIRE(lines.size() == 2);
    CHECK(lines[0]["method"] == "notifications/progress");
    CHECK(lines[0]["params"]["progressToken"] == "tok-1");
    CHECK(lines[0]["params"]["progress"] == 1.0);
    CHECK(lines[0]["params"]["total"] == 4.0);
    CHECK_FALSE(lines[1]["params"].contains("total"));
}

TEST_CASE("ExtractProgressToken: accepts strings and integers only", "[mcp][progress]") {
    auto text_token = ExtractProgressToken({{"_meta", {{"progressToken", "abc"}}}});
    REQUIRE(text_token.has_value());
    CHECK(*text_token == "abc");
    auto int_token = ExtractProgressToken({{"_meta", {{"progressToken", 7}}}});
    REQUIRE(int_token.has_value());
    CHECK(*int_token == 7);
    CHECK_FALSE(ExtractProgressToken({{"_meta", {{"progressToken", ""}}}}).has_value());
    CHECK_FALSE(ExtractProgressToken({{"_meta", {{"progressToken", 1.5}}}}).has_value());
    CHECK_FALSE(ExtractProgressToken({{"_meta", "x"}}).has_value());
    CHECK_FALSE(ExtractProgressToken({{"name", "t"}}).has_value());
    CHECK_FALSE(ExtractProgressToken(nlohmann::json::array()).has_value());
}
