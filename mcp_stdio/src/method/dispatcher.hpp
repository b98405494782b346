#pragma once

#include "method_registry.hpp"

#include "../protocol.hpp"
#include "../server_context.hpp"

#include <log4cplus/logger.h>

namespace mcp::methods {

/**
 * Routes classified messages to their handlers.
 *
 * Requests and notifications are looked up in separate tables. A request
 * always yields exactly one outcome; notification failures are only logged.
 */
class Dispatcher {
public:
	Dispatcher(const MethodRegistry& requests,
	           const MethodRegistry& notifications,
	           ServerContext& context,
	           log4cplus::Logger logger);

	HandlerOutcome dispatch(const Request& request);
	void dispatch(const Notification& notification);

private:
	HandlerOutcome invoke(MethodHandler& handler, const std::string& method, const std::optional<nlohmann::json>& params);

	const MethodRegistry& requests_;
	const MethodRegistry& notifications_;
	ServerContext& context_;
	log4cplus::Logger logger_;
};

} // namespace mcp::methods
