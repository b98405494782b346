#pragma once

#include "protocol.hpp"

#include <string>
#include <variant>

namespace mcp {

struct ParseFailure {
    std::string reason;
};

using Message = std::variant<Request, Notification, ParseFailure>;

/**
 * Classify one line of input.
 *
 * The line is decoded as a Request first; only if that fails is it decoded as a
 * Notification, which additionally requires the "id" member to be absent.
 * Anything else, including text that is not JSON, is a ParseFailure.
 */
Message classify(const std::string& line);

} // namespace mcp
