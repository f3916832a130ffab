#pragma once

#include <optional>

namespace mcp_host {

// Receives progress updates from a running tool. The host binds one to the
// caller's progress token; without a token tools get the null reporter.
class IProgressReporter {
public:
    virtual ~IProgressReporter() = default;
    virtual void Report(double progress,
                        std::optional<double> total = std::nullopt) = 0;
};

class NullProgressReporter : public IProgressReporter {
public:
    void Report(double, std::optional<double>) override {}

    static NullProgressReporter& Instance();
};

} // namespace mcp_host
