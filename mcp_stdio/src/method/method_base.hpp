#pragma once

#include "../protocol.hpp"
#include "../server_context.hpp"

#include <log4cplus/logger.h>
#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <variant>

namespace mcp::methods {

/// Result of one handler invocation: a result value or an error object, never both.
class HandlerOutcome {
public:
	static HandlerOutcome success(nlohmann::json result);
	static HandlerOutcome failure(ErrorObject error);

	bool ok() const { return std::holds_alternative<nlohmann::json>(value_); }
	const nlohmann::json& result() const { return std::get<nlohmann::json>(value_); }
	const ErrorObject& error() const { return std::get<ErrorObject>(value_); }

private:
	explicit HandlerOutcome(std::variant<nlohmann::json, ErrorObject> value) : value_(std::move(value)) {}

	std::variant<nlohmann::json, ErrorObject> value_;
};

struct MethodContext {
	const std::string& method;
	ServerContext& context;
	const std::optional<nlohmann::json>& params;
	log4cplus::Logger& logger;
};

class MethodHandler {
public:
	virtual ~MethodHandler() = default;
	virtual const char* name() const = 0;
	virtual HandlerOutcome handle(MethodContext& ctx) = 0;

protected:
	const nlohmann::json* find_param(const MethodContext& ctx, const std::string& key) const;
	std::string string_param(const MethodContext& ctx, const std::string& key, const std::string& fallback) const;
};

} // namespace mcp::methods
