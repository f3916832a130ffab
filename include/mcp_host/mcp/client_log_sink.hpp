#pragma once

#include <mcp_host/core/log.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string_view>

namespace mcp_host {

class OutputChannel;

// Syslog-style levels used by logging/setLevel and notifications/message.
enum class McpLogLevel {
    Debug = 0,
    Info,
    Notice,
    Warning,
    Error,
    Critical,
    Alert,
    Emergency,
};

const char* McpLogLevelName(McpLogLevel level);
std::optional<McpLogLevel> ParseMcpLogLevel(std::string_view text);
McpLogLevel ToMcpLogLevel(LogLevel level);

// ---------------------------------------------------------------------------
// ClientLogSink — forwards diagnostic records to the connected client as
// notifications/message, gated by the level the client selected (default
// warning). Records before Attach() or after Detach() are dropped.
// ---------------------------------------------------------------------------
class ClientLogSink : public ILogSink {
public:
    ClientLogSink() = default;

    void Attach(std::shared_ptr<OutputChannel> channel);
    void Detach();

    void SetLevel(McpLogLevel level);
    [[nodiscard]] McpLogLevel Level() const;

    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<OutputChannel> channel_;
    McpLogLevel min_level_ = McpLogLevel::Warning;
};

} // namespace mcp_host
