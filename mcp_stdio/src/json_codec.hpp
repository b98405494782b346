#pragma once

#include "protocol.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>

namespace mcp::codec {

/// Raised when a JSON value does not have the shape of the requested message.
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

std::optional<Id> decode_id(const nlohmann::json& value);
nlohmann::json encode_id(const Id& id);
std::string id_to_string(const Id& id);

Request decode_request(const nlohmann::json& root);
Notification decode_notification(const nlohmann::json& root);
SuccessResponse decode_success_response(const nlohmann::json& root);
ErrorResponse decode_error_response(const nlohmann::json& root);

nlohmann::json encode(const Request& request);
nlohmann::json encode(const Notification& notification);
nlohmann::json encode(const ErrorObject& error);
nlohmann::json encode(const SuccessResponse& response);
nlohmann::json encode(const ErrorResponse& response);

const nlohmann::json* find_key(const nlohmann::json& obj, const std::string& key);
std::string as_string(const nlohmann::json& obj, const std::string& fallback = "");

} // namespace mcp::codec
