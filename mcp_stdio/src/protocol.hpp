#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace mcp {

inline constexpr const char* kJsonRpcVersion = "2.0";

/// Standard JSON-RPC 2.0 error codes. These values are part of the wire format.
enum class ErrorCode : int32_t {
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,
};

/// Request identifier: a bare JSON number or a bare JSON string, never tagged.
using Id = std::variant<uint64_t, std::string>;

/// Identifier used for responses to lines that could not be parsed at all.
inline const Id kParseErrorId = Id{uint64_t{0}};

struct Request {
    Id id;
    std::string method;
    std::optional<nlohmann::json> params;
};

struct Notification {
    std::string method;
    std::optional<nlohmann::json> params;
};

struct ErrorObject {
    int32_t code = 0;
    std::string message;
    std::optional<nlohmann::json> data;
};

struct SuccessResponse {
    Id id;
    std::optional<nlohmann::json> result; // serialized as null when absent
};

struct ErrorResponse {
    Id id;
    ErrorObject error;
};

inline bool operator==(const ErrorObject& lhs, const ErrorObject& rhs) {
    return lhs.code == rhs.code && lhs.message == rhs.message && lhs.data == rhs.data;
}

inline bool operator==(const Request& lhs, const Request& rhs) {
    return lhs.id == rhs.id && lhs.method == rhs.method && lhs.params == rhs.params;
}

inline bool operator==(const Notification& lhs, const Notification& rhs) {
    return lhs.method == rhs.method && lhs.params == rhs.params;
}

inline bool operator==(const SuccessResponse& lhs, const SuccessResponse& rhs) {
    return lhs.id == rhs.id && lhs.result == rhs.result;
}

inline bool operator==(const ErrorResponse& lhs, const ErrorResponse& rhs) {
    return lhs.id == rhs.id && lhs.error == rhs.error;
}

inline ErrorObject make_error(ErrorCode code, std::string message, std::optional<nlohmann::json> data = std::nullopt) {
    return ErrorObject{static_cast<int32_t>(code), std::move(message), std::move(data)};
}

} // namespace mcp
