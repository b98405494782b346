#pragma once

#include <nlohmann/json.hpp>

#include <atomic>
#include <string>

inline constexpr const char* kDefaultProtocolVersion = "2024-11-05";

struct ServerInfo {
    std::string name = "mcp_stdio";
    std::string version = "0.0.0";
};

/**
 * Identity and handshake state shared by all method handlers.
 */
struct ServerContext {
    ServerInfo server_info;

    // reported by initialize when the client does not send params.protocolVersion
    std::string default_protocol_version = kDefaultProtocolVersion;

    nlohmann::json capabilities = nlohmann::json::object();

    // set once notifications/initialized has been received
    std::atomic<bool> initialized{false};
};
