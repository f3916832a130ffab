#include <mcp_host/mcp/progress_notifier.hpp>

#include <mcp_host/mcp/output_channel.hpp>

namespace mcp_host {

ProgressNotifier::ProgressNotifier(nlohmann::json token,
                                   std::shared_ptr<OutputChannel> channel)
    : token_(std::move(token)), channel_(std::move(channel)) {}

void ProgressNotifier::Report(double progress, std::optional<double> total) {
    if (!channel_) {
        return;
    }
    nlohmann::json params = {
        {"progressToken", token_},
        {"progress", progress},
    };
    if (total) {
        params["total"] = *total;
    }
    channel_->Send({
        {"jsonrpc", "2.0"},
        {"method", "notifications/progress"},
        {"params", std::move(params)},
    });
}

std::optional<nlohmann::json> ExtractProgressToken(const nlohmann::json& params) {
    if (!params.is_object()) {
        return std::nullopt;
    }
    auto meta = params.find("_meta");
    if (meta == params.end() || !meta->is_object()) {
        return std::nullopt;
    }
    auto token = meta->find("progressToken");
    if (token == meta->end()) {
        return std::nullopt;
    }
    if ((token->is_string() && !token->get<std::string>().empty()) ||
        token->is_number_integer()) {
        return *token;
    }
    return std::nullopt;
}

} // namespace mcp_host
