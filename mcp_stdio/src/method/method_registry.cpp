#include "method_registry.hpp"

#include <log4cplus/loggingmacros.h>

namespace mcp::methods {

bool MethodRegistry::add(std::unique_ptr<MethodHandler> handler) {
	if (!handler) {
		LOG4CPLUS_WARN(logger_, "Ignoring null method handler");
		return false;
	}

	std::string name = handler->name();
	if (name.empty()) {
		LOG4CPLUS_WARN(logger_, "Ignoring method handler without a name");
		return false;
	}

	auto inserted = handlers_.emplace(name, std::move(handler));
	if (!inserted.second) {
		LOG4CPLUS_WARN(logger_, "Duplicate registration for method " << name << " rejected");
		return false;
	}

	LOG4CPLUS_DEBUG(logger_, "Registered method " << name);
	return true;
}

MethodHandler* MethodRegistry::find(const std::string& method) const {
	auto it = handlers_.find(method);
	if (it == handlers_.end()) {
		return nullptr;
	}
	return it->second.get();
}

} // namespace mcp::methods
