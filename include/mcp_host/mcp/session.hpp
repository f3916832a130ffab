#pragma once

#include <mcp_host/pipeline/authorization.hpp>

#include <optional>
#include <string>

namespace mcp_host {

enum class SessionPhase {
    Uninitialized,
    Initializing,
    Ready,
};

inline const char* SessionPhaseName(SessionPhase phase) {
    switch (phase) {
        case SessionPhase::Uninitialized: return "uninitialized";
        case SessionPhase::Initializing:  return "initializing";
        case SessionPhase::Ready:         return "ready";
    }
    return "unknown";
}

struct ClientInfo {
    std::string name = "unknown";
    std::string version = "unknown";
};

// State of the one stdio session; changed only by the handshake.
struct Session {
    SessionPhase phase = SessionPhase::Uninitialized;
    std::string protocol_version;
    ClientInfo client;
    std::optional<Identity> identity;
};

} // namespace mcp_host
