#pragma once

#include <mcp_host/plugin/progress.hpp>

#include <memory>
#include <optional>

#include <nlohmann/json.hpp>

namespace mcp_host {

class OutputChannel;

// Sends notifications/progress for one call's progress token.
class ProgressNotifier : public IProgressReporter {
public:
    ProgressNotifier(nlohmann::json token, std::shared_ptr<OutputChannel> channel);

    void Report(double progress, std::optional<double> total = std::nullopt) override;

    [[nodiscard]] const nlohmann::json& Token() const noexcept { return token_; }

private:
    nlohmann::json token_;
    std::shared_ptr<OutputChannel> channel_;
};

/// `params._meta.progressToken` when it is a string or an integer.
std::optional<nlohmann::json> ExtractProgressToken(const nlohmann::json& params);

} // namespace mcp_host
