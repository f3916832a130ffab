#pragma once

#include <string>
#include <string_view>

namespace mcp_host {

/// Standard base64 (RFC 4648) with '=' padding.
std::string EncodeBase64(std::string_view bytes);

} // namespace mcp_host
