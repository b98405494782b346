#pragma once

#include "method_base.hpp"

#include "../logger.hpp"

#include <log4cplus/logger.h>

#include <memory>
#include <string>
#include <unordered_map>

namespace mcp::methods {

class MethodRegistry {
public:
	explicit MethodRegistry(log4cplus::Logger logger = rpc_logger()) : logger_(std::move(logger)) {}

	/// Returns false if the handler is null or its name is already taken; the first registration wins.
	bool add(std::unique_ptr<MethodHandler> handler);
	MethodHandler* find(const std::string& method) const;
	size_t size() const { return handlers_.size(); }

private:
	std::unordered_map<std::string, std::unique_ptr<MethodHandler>> handlers_;
	log4cplus::Logger logger_;
};

void register_lifecycle_requests(MethodRegistry& registry);
void register_lifecycle_notifications(MethodRegistry& registry);

} // namespace mcp::methods
