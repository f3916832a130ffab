#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_host {

// ---------------------------------------------------------------------------
// ContentBlock — one typed block of a tool result.
//
// type "text" carries `text`; "image", "audio" and "resource" carry base64
// `data` plus `mime_type`.
// ---------------------------------------------------------------------------
struct ContentBlock {
    std::string type = "text";
    std::optional<std::string> text;
    std::optional<std::string> data;
    std::optional<std::string> mime_type;

    static ContentBlock Text(std::string text);
    static ContentBlock Binary(std::string type, std::string base64_data,
                               std::string mime_type);

    bool operator==(const ContentBlock& other) const {
        return type == other.type && text == other.text &&
               data == other.data && mime_type == other.mime_type;
    }
    bool operator!=(const ContentBlock& other) const { return !(*this == other); }
};

// ---------------------------------------------------------------------------
// ToolCallResult — what every tool returns. Tools report their own failures
// by setting is_error with a descriptive text block; they should not throw.
// ---------------------------------------------------------------------------
struct ToolCallResult {
    std::vector<ContentBlock> content;
    bool is_error = false;

    static ToolCallResult Success(std::string text);
    static ToolCallResult Failure(std::string text);

    /// Text of the first text block, or an empty string.
    [[nodiscard]] std::string FirstText() const;

    bool operator==(const ToolCallResult& other) const {
        return is_error == other.is_error && content == other.content;
    }
    bool operator!=(const ToolCallResult& other) const { return !(*this == other); }
};

void to_json(nlohmann::json& j, const ContentBlock& block);
void from_json(const nlohmann::json& j, ContentBlock& block);
void to_json(nlohmann::json& j, const ToolCallResult& result);
void from_json(const nlohmann::json& j, ToolCallResult& result);

} // namespace mcp_host
