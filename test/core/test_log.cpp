#include <catch2/catch_test_macros.hpp>

#include <mcp_host/core/log.hpp>

#include "../mocks/capture_sink.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace mcp_host;
using mcp_host::testing::CaptureSink;

// ===========================================================================
// LogLevel parsing
// ===========================================================================

TEST_CASE("ParseLogLevel: accepts names case-insensitively", "[log]") {
    CHECK(ParseLogLevel("debug") == LogLevel::Debug);
    CHECK(ParseLogLevel("INFO") == LogLevel::Info);
    CHECK(ParseLogLevel("warn") == LogLevel::Warn);
    CHECK(ParseLogLevel("Warning") == LogLevel::Warn);
    CHECK(ParseLogLevel("error") == LogLevel::Error);
    CHECK_FALSE(ParseLogLevel("verbose").has_value());
    CHECK_FALSE(ParseLogLevel("").has_value());
}

// ===========================================================================
// JsonSink
// ===========================================================================

TEST_CASE("JsonSink: writes one JSON object per line", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "plugins", "loaded 2 tools");
    sink.Write(LogLevel::Warn, "registry", "duplicate tool");

    auto output = oss.str();
    CHECK(std::count(output.begin(), output.end(), '\n') == 2);
    CHECK(output.find("\"level\":\"INFO\"") != std::string::npos);
    CHECK(output.find("\"component\":\"plugins\"") != std::string::npos);
    CHECK(output.find("\"message\":\"loaded 2 tools\"") != std::string::npos);
    CHECK(output.find("\"ts\":\"") != std::string::npos);
}

TEST_CASE("JsonSink: escapes special characters in message", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Error, "esc", "a\nb\t\"q\" c\\d");

    auto output = oss.str();
    CHECK(output.find("a\\nb\\t\\\"q\\\" c\\\\d") != std::string::npos);
}

// ===========================================================================
// ColorConsoleSink
// ===========================================================================

TEST_CASE("ColorConsoleSink: plain mode has no ANSI codes", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(false, oss);

    sink.Write(LogLevel::Info, "server", "serving 3 tool(s)");

    auto output = oss.str();
    CHECK(output.find("[INFO]") != std::string::npos);
    CHECK(output.find("[server]") != std::string::npos);
    CHECK(output.find("serving 3 tool(s)") != std::string::npos);
    CHECK(output.find("\033[") == std::string::npos);
}

TEST_CASE("ColorConsoleSink: color mode uses a distinct code per level", "[log]") {
    std::ostringstream debug_oss, warn_oss, error_oss;
    ColorConsoleSink(true, debug_oss).Write(LogLevel::Debug, "x", "m");
    ColorConsoleSink(true, warn_oss).Write(LogLevel::Warn, "x", "m");
    ColorConsoleSink(true, error_oss).Write(LogLevel::Error, "x", "m");

    CHECK(debug_oss.str().find("\033[90m") != std::string::npos);
    CHECK(warn_oss.str().find("\033[33m") != std::string::npos);
    CHECK(error_oss.str().find("\033[1;31m") != std::string::npos);
    CHECK(error_oss.str().back() == '\n');
}

// ===========================================================================
// FileSink
// ===========================================================================

TEST_CASE("FileSink: appends plain and JSON lines", "[log]") {
    auto path = std::filesystem::temp_directory_path() / "mcp_host_test_file_sink.log";
    std::filesystem::remove(path);

    {
        FileSink plain(path.string(), false);
        REQUIRE(plain.IsOpen());
        plain.Write(LogLevel::Warn, "audit", "first");
    }
    {
        FileSink json(path.string(), true);
        json.Write(LogLevel::Info, "audit", "second");
    }

    std::ifstream in(path);
    std::string line1, line2;
    std::getline(in, line1);
    std::getline(in, line2);
    CHECK(line1.find("[WARN] [audit] first") != std::string::npos);
    CHECK(line2.find("\"message\":\"second\"") != std::string::npos);

    std::filesystem::remove(path);
}

TEST_CASE("FileSink: unopenable path is reported, writes are dropped", "[log]") {
    FileSink sink("/nonexistent-dir/deeper/x.log", false);
    CHECK_FALSE(sink.IsOpen());
    sink.Write(LogLevel::Error, "c", "dropped");
}

// ===========================================================================
// LevelFilterSink / TeeSink
// ===========================================================================

TEST_CASE("LevelFilterSink: drops records below its threshold", "[log]") {
    auto capture = std::make_unique<CaptureSink>();
    auto* captured = capture.get();
    LevelFilterSink filter(std::move(capture), LogLevel::Warn);

    filter.Write(LogLevel::Debug, "c", "no");
    filter.Write(LogLevel::Info, "c", "no");
    filter.Write(LogLevel::Warn, "c", "yes");
    filter.Write(LogLevel::Error, "c", "yes");

    REQUIRE(captured->messages.size() == 2);
    CHECK(captured->messages[0].level == LogLevel::Warn);
}

TEST_CASE("TeeSink: every sink sees every record, each with its own filter", "[log]") {
    auto all = std::make_shared<CaptureSink>();
    auto errors_inner = std::make_unique<CaptureSink>();
    auto* errors = errors_inner.get();
    auto errors_only = std::make_shared<LevelFilterSink>(std::move(errors_inner),
                                                         LogLevel::Error);

    TeeSink tee({all, errors_only, nullptr});
    tee.Write(LogLevel::Info, "c", "info");
    tee.Write(LogLevel::Error, "c", "boom");

    CHECK(all->messages.size() == 2);
    REQUIRE(errors->messages.size() == 1);
    CHECK(errors->messages[0].message == "boom");
}

// ===========================================================================
// Logger
// ===========================================================================

TEST_CASE("Logger: respects min_level and SetLevel", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Error);

    logger.Info("c", "filtered");
    CHECK(sink_ptr->messages.empty());

    logger.SetLevel(LogLevel::Info);
    logger.Info("pipeline", "now passes");
    REQUIRE(sink_ptr->messages.size() == 1);
    CHECK(sink_ptr->messages[0].component == "pipeline");
    CHECK(sink_ptr->messages[0].message == "now passes");
}

TEST_CASE("Logger: concurrent logging keeps every record", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Debug);

    constexpr int kThreads = 8;
    constexpr int kMessagesPerThread = 100;

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < kMessagesPerThread; ++i) {
                logger.Log(LogLevel::Info, "worker-" + std::to_string(t),
                           "call-" + std::to_string(i));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    CHECK(sink_ptr->messages.size() == kThreads * kMessagesPerThread);
}
