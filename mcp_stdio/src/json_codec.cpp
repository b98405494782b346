#include "json_codec.hpp"

#include <limits>

namespace mcp::codec {

namespace {

void check_envelope(const nlohmann::json& root) {
    if (!root.is_object()) {
        throw DecodeError("message is not a JSON object");
    }
    const nlohmann::json* version = find_key(root, "jsonrpc");
    if (!version) {
        throw DecodeError("missing field 'jsonrpc'");
    }
    if (as_string(*version) != kJsonRpcVersion) {
        throw DecodeError("field 'jsonrpc' must be \"2.0\"");
    }
}

Id require_id(const nlohmann::json& root) {
    const nlohmann::json* id_obj = find_key(root, "id");
    if (!id_obj) {
        throw DecodeError("missing field 'id'");
    }
    auto id = decode_id(*id_obj);
    if (!id) {
        throw DecodeError("field 'id' must be an unsigned integer or a string");
    }
    return *id;
}

std::string require_method(const nlohmann::json& root) {
    const nlohmann::json* method_obj = find_key(root, "method");
    if (!method_obj) {
        throw DecodeError("missing field 'method'");
    }
    if (!method_obj->is_string()) {
        throw DecodeError("field 'method' must be a string");
    }
    std::string method = method_obj->get<std::string>();
    if (method.empty()) {
        throw DecodeError("field 'method' must not be empty");
    }
    return method;
}

std::optional<nlohmann::json> optional_value(const nlohmann::json& root, const std::string& key) {
    const nlohmann::json* value = find_key(root, key);
    if (!value || value->is_null()) {
        return std::nullopt;
    }
    return *value;
}

nlohmann::json envelope(const Id& id) {
    nlohmann::json out = nlohmann::json::object();
    out["jsonrpc"] = kJsonRpcVersion;
    out["id"] = encode_id(id);
    return out;
}

} // namespace

std::optional<Id> decode_id(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        return Id{value.get<uint64_t>()};
    }
    if (value.is_string()) {
        return Id{value.get<std::string>()};
    }
    return std::nullopt;
}

nlohmann::json encode_id(const Id& id) {
    if (const auto* number = std::get_if<uint64_t>(&id)) {
        return nlohmann::json(*number);
    }
    return nlohmann::json(std::get<std::string>(id));
}

std::string id_to_string(const Id& id) {
    if (const auto* number = std::get_if<uint64_t>(&id)) {
        return std::to_string(*number);
    }
    return std::get<std::string>(id);
}

Request decode_request(const nlohmann::json& root) {
    check_envelope(root);
    Request request;
    request.id = require_id(root);
    request.method = require_method(root);
    request.params = optional_value(root, "params");
    return request;
}

Notification decode_notification(const nlohmann::json& root) {
    check_envelope(root);
    if (find_key(root, "id")) {
        throw DecodeError("notification must not carry an 'id'");
    }
    Notification notification;
    notification.method = require_method(root);
    notification.params = optional_value(root, "params");
    return notification;
}

SuccessResponse decode_success_response(const nlohmann::json& root) {
    check_envelope(root);
    if (find_key(root, "error")) {
        throw DecodeError("success response must not carry an 'error'");
    }
    if (!find_key(root, "result")) {
        throw DecodeError("missing field 'result'");
    }
    SuccessResponse response;
    response.id = require_id(root);
    response.result = optional_value(root, "result");
    return response;
}

ErrorResponse decode_error_response(const nlohmann::json& root) {
    check_envelope(root);
    if (find_key(root, "result")) {
        throw DecodeError("error response must not carry a 'result'");
    }
    const nlohmann::json* error_obj = find_key(root, "error");
    if (!error_obj || !error_obj->is_object()) {
        throw DecodeError("field 'error' must be an object");
    }

    const nlohmann::json* code_obj = find_key(*error_obj, "code");
    if (!code_obj || !code_obj->is_number_integer()) {
        throw DecodeError("field 'error.code' must be an integer");
    }
    if (code_obj->is_number_unsigned() &&
        code_obj->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) {
        throw DecodeError("field 'error.code' is out of range");
    }
    int64_t code = code_obj->get<int64_t>();
    if (code < std::numeric_limits<int32_t>::min() || code > std::numeric_limits<int32_t>::max()) {
        throw DecodeError("field 'error.code' is out of range");
    }

    const nlohmann::json* message_obj = find_key(*error_obj, "message");
    if (!message_obj || !message_obj->is_string()) {
        throw DecodeError("field 'error.message' must be a string");
    }

    ErrorResponse response;
    response.id = require_id(root);
    response.error.code = static_cast<int32_t>(code);
    response.error.message = message_obj->get<std::string>();
    response.error.data = optional_value(*error_obj, "data");
    return response;
}

nlohmann::json encode(const Request& request) {
    nlohmann::json out = envelope(request.id);
    out["method"] = request.method;
    if (request.params) {
        out["params"] = *request.params;
    }
    return out;
}

nlohmann::json encode(const Notification& notification) {
    nlohmann::json out = nlohmann::json::object();
    out["jsonrpc"] = kJsonRpcVersion;
    out["method"] = notification.method;
    if (notification.params) {
        out["params"] = *notification.params;
    }
    return out;
}

nlohmann::json encode(const ErrorObject& error) {
    nlohmann::json out = nlohmann::json::object();
    out["code"] = error.code;
    out["message"] = error.message;
    if (error.data) {
        out["data"] = *error.data;
    }
    return out;
}

nlohmann::json encode(const SuccessResponse& response) {
    nlohmann::json out = envelope(response.id);
    out["result"] = response.result ? *response.result : nlohmann::json(nullptr);
    return out;
}

nlohmann::json encode(const ErrorResponse& response) {
    nlohmann::json out = envelope(response.id);
    out["error"] = encode(response.error);
    return out;
}

const nlohmann::json* find_key(const nlohmann::json& obj, const std::string& key) {
    if (!obj.is_object()) {
        return nullptr;
    }
    auto it = obj.find(key);
    if (it == obj.end()) {
        return nullptr;
    }
    return &*it;
}

std::string as_string(const nlohmann::json& obj, const std::string& fallback) {
    if (obj.is_string()) {
        return obj.get<std::string>();
    }
    return fallback;
}

} // namespace mcp::codec
