#pragma once

#include "method/method_base.hpp"
#include "protocol.hpp"
#include "stdio_transport.hpp"

#include <log4cplus/logger.h>
#include <nlohmann/json.hpp>

namespace mcp {

/**
 * Serializes responses and hands them to the output transport.
 *
 * Every call emits exactly one line. A response that cannot be serialized is
 * logged and replaced by an InternalError for the same id; TransportError from
 * the writer propagates to the caller.
 */
class Responder {
public:
    Responder(LineWriter& writer, log4cplus::Logger logger);

    void reply(const Id& id, const methods::HandlerOutcome& outcome);
    void reply_error(const Id& id, ErrorObject error);
    void reply_parse_error();

private:
    void send(const Id& id, const nlohmann::json& message);

    LineWriter& writer_;
    log4cplus::Logger logger_;
};

} // namespace mcp
