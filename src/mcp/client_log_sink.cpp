#include <mcp_host/mcp/client_log_sink.hpp>

#include <mcp_host/core/strings.hpp>
#include <mcp_host/mcp/output_channel.hpp>

#include <array>

#include <nlohmann/json.hpp>

namespace mcp_host {

namespace {

constexpr std::array<const char*, 8> kLevelNames = {
    "debug", "info", "notice", "warning", "error", "critical", "alert", "emergency",
};

} // anonymous namespace

const char* McpLogLevelName(McpLogLevel level) {
    return kLevelNames[static_cast<std::size_t>(level)];
}

std::optional<McpLogLevel> ParseMcpLogLevel(std::string_view text) {
    for (std::size_t i = 0; i < kLevelNames.size(); ++i) {
        if (EqualsIgnoreCase(text, kLevelNames[i])) {
            return static_cast<McpLogLevel>(i);
        }
    }
    return std::nullopt;
}

McpLogLevel ToMcpLogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return McpLogLevel::Debug;
        case LogLevel::Info:  return McpLogLevel::Info;
        case LogLevel::Warn:  return McpLogLevel::Warning;
        case LogLevel::Error: return McpLogLevel::Error;
    }
    return McpLogLevel::Emergency;
}

void ClientLogSink::Attach(std::shared_ptr<OutputChannel> channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    channel_ = std::move(channel);
}

void ClientLogSink::Detach() {
    std::lock_guard<std::mutex> lock(mutex_);
    channel_.reset();
}

void ClientLogSink::SetLevel(McpLogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

McpLogLevel ClientLogSink::Level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void ClientLogSink::Write(LogLevel level, std::string_view component,
                          std::string_view message) {
    const auto mcp_level = ToMcpLogLevel(level);
    std::shared_ptr<OutputChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!channel_ || mcp_level < min_level_) {
            return;
        }
        channel = channel_;
    }

    channel->Send({
        {"jsonrpc", "2.0"},
        {"method", "notifications/message"},
        {"params", {
            {"level", McpLogLevelName(mcp_level)},
            {"logger", std::string(component)},
            {"data", std::string(message)},
        }},
    });
}

} // namespace mcp_host
