#include <mcp_host/plugin/tool_result.hpp>

namespace mcp_host {

ContentBlock ContentBlock::Text(std::string text) {
    ContentBlock block;
    block.type = "text";
    block.text = std::move(text);
    return block;
}

ContentBlock ContentBlock::Binary(std::string type, std::string base64_data,
                                  std::string mime_type) {
    ContentBlock block;
    block.type = std::move(type);
    block.data = std::move(base64_data);
    block.mime_type = std::move(mime_type);
    return block;
}

ToolCallResult ToolCallResult::Success(std::string text) {
    ToolCallResult result;
    result.content.push_back(ContentBlock::Text(std::move(text)));
    return result;
}

ToolCallResult ToolCallResult::Failure(std::string text) {
    ToolCallResult result;
    result.content.push_back(ContentBlock::Text(std::move(text)));
    result.is_error = true;
    return result;
}

std::string ToolCallResult::FirstText() const {
    for (const auto& block : content) {
        if (block.type == "text" && block.text.has_value()) {
            return *block.text;
        }
    }
    return "";
}

void to_json(nlohmann::json& j, const ContentBlock& block) {
    j = nlohmann::json{{"type", block.type}};
    if (block.text) j["text"] = *block.text;
    if (block.data) j["data"] = *block.data;
    if (block.mime_type) j["mimeType"] = *block.mime_type;
}

void from_json(const nlohmann::json& j, ContentBlock& block) {
    block.type = j.value("type", "text");
    block.text.reset();
    block.data.reset();
    block.mime_type.reset();
    if (j.contains("text") && j["text"].is_string()) {
        block.text = j["text"].get<std::string>();
    }
    if (j.contains("data") && j["data"].is_string()) {
        block.data = j["data"].get<std::string>();
    }
    if (j.contains("mimeType") && j["mimeType"].is_string()) {
        block.mime_type = j["mimeType"].get<std::string>();
    }
}

void to_json(nlohmann::json& j, const ToolCallResult& result) {
    j = nlohmann::json{{"content", result.content},
                       {"isError", result.is_error}};
}

void from_json(const nlohmann::json& j, ToolCallResult& result) {
    result.content.clear();
    if (j.contains("content") && j["content"].is_array()) {
        result.content = j["content"].get<std::vector<ContentBlock>>();
    }
    result.is_error = j.value("isError", false);
}

} // namespace mcp_host
