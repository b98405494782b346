#include "method_base.hpp"
#include "method_registry.hpp"

#include <log4cplus/loggingmacros.h>

#include <memory>
#include <string>

namespace mcp::methods {

class InitializeMethod final : public MethodHandler {
public:
	const char* name() const override { return "initialize"; }

	HandlerOutcome handle(MethodContext& ctx) override {
		LOG4CPLUS_INFO(ctx.logger, "Initializing server...");

		std::string protocol_version = string_param(ctx, "protocolVersion", ctx.context.default_protocol_version);

		nlohmann::json result = nlohmann::json::object();
		result["protocolVersion"] = protocol_version;
		result["capabilities"] = ctx.context.capabilities;
		result["serverInfo"] = {
			{"name", ctx.context.server_info.name},
			{"version", ctx.context.server_info.version},
		};
		return HandlerOutcome::success(std::move(result));
	}
};

class PingMethod final : public MethodHandler {
public:
	const char* name() const override { return "ping"; }

	HandlerOutcome handle(MethodContext& ctx) override {
		LOG4CPLUS_DEBUG(ctx.logger, "Client ping server...");
		return HandlerOutcome::success(nlohmann::json::object());
	}
};

class InitializedNotification final : public MethodHandler {
public:
	const char* name() const override { return "notifications/initialized"; }

	HandlerOutcome handle(MethodContext& ctx) override {
		ctx.context.initialized.store(true);
		LOG4CPLUS_INFO(ctx.logger, "Server initialized.");
		return HandlerOutcome::success(nlohmann::json::object());
	}
};

void register_lifecycle_requests(MethodRegistry& registry) {
	registry.add(std::make_unique<InitializeMethod>());
	registry.add(std::make_unique<PingMethod>());
}

void register_lifecycle_notifications(MethodRegistry& registry) {
	registry.add(std::make_unique<InitializedNotification>());
}

} // namespace mcp::methods
