#include "dispatcher.hpp"

#include "../json_codec.hpp"

#include <log4cplus/loggingmacros.h>

#include <exception>

namespace mcp::methods {

HandlerOutcome HandlerOutcome::success(nlohmann::json result) {
	return HandlerOutcome(std::move(result));
}

HandlerOutcome HandlerOutcome::failure(ErrorObject error) {
	return HandlerOutcome(std::move(error));
}

const nlohmann::json* MethodHandler::find_param(const MethodContext& ctx, const std::string& key) const {
	if (!ctx.params) {
		return nullptr;
	}
	return codec::find_key(*ctx.params, key);
}

std::string MethodHandler::string_param(const MethodContext& ctx, const std::string& key, const std::string& fallback) const {
	if (auto value = find_param(ctx, key)) {
		return codec::as_string(*value, fallback);
	}
	return fallback;
}

Dispatcher::Dispatcher(const MethodRegistry& requests,
                       const MethodRegistry& notifications,
                       ServerContext& context,
                       log4cplus::Logger logger)
	: requests_(requests),
	  notifications_(notifications),
	  context_(context),
	  logger_(std::move(logger)) {}

HandlerOutcome Dispatcher::invoke(MethodHandler& handler, const std::string& method, const std::optional<nlohmann::json>& params) {
	MethodContext ctx{method, context_, params, logger_};
	try {
		return handler.handle(ctx);
	} catch (const std::exception& exc) {
		LOG4CPLUS_ERROR(logger_, "Handler for " << method << " failed: " << exc.what());
		return HandlerOutcome::failure(make_error(ErrorCode::InternalError, std::string("Internal error: ") + exc.what()));
	} catch (...) {
		LOG4CPLUS_ERROR(logger_, "Handler for " << method << " failed with a non-standard exception");
		return HandlerOutcome::failure(make_error(ErrorCode::InternalError, "Internal error: unknown exception"));
	}
}

HandlerOutcome Dispatcher::dispatch(const Request& request) {
	LOG4CPLUS_INFO(logger_, "Request: " << request.method << " id=" << codec::id_to_string(request.id));

	MethodHandler* handler = requests_.find(request.method);
	if (!handler) {
		LOG4CPLUS_ERROR(logger_, "Unknown request method: " << request.method);
		return HandlerOutcome::failure(
			make_error(ErrorCode::InvalidRequest, "Invalid request: '" + request.method + "'"));
	}
	return invoke(*handler, request.method, request.params);
}

void Dispatcher::dispatch(const Notification& notification) {
	LOG4CPLUS_INFO(logger_, "Notification: " << notification.method);

	MethodHandler* handler = notifications_.find(notification.method);
	if (!handler) {
		LOG4CPLUS_ERROR(logger_, "Unknown notification method: " << notification.method);
		return;
	}

	HandlerOutcome outcome = invoke(*handler, notification.method, notification.params);
	if (!outcome.ok()) {
		LOG4CPLUS_ERROR(logger_, "Notification " << notification.method << " failed: " << outcome.error().message);
	}
}

} // namespace mcp::methods
