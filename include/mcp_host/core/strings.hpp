#pragma once

#include <string>
#include <string_view>

namespace mcp_host {

/// ASCII lower-casing.
std::string ToLower(std::string_view text);

/// ASCII case-insensitive equality.
bool EqualsIgnoreCase(std::string_view a, std::string_view b);

} // namespace mcp_host
