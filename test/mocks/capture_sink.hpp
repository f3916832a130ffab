#pragma once

#include <mcp_host/core/log.hpp>

#include <mutex>
#include <string>
#include <vector>

namespace mcp_host {
namespace testing {

struct CapturedMessage {
    LogLevel level;
    std::string component;
    std::string message;
};

// A sink that captures records into a vector.
class CaptureSink : public ILogSink {
public:
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        messages.push_back(
            {level, std::string(component), std::string(message)});
    }

    std::vector<CapturedMessage> messages;

private:
    std::mutex mutex_;
};

} // namespace testing
} // namespace mcp_host
