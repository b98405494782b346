#include "responder.hpp"

#include "json_codec.hpp"

#include <log4cplus/loggingmacros.h>

#include <string>

namespace mcp {

Responder::Responder(LineWriter& writer, log4cplus::Logger logger)
    : writer_(writer),
      logger_(std::move(logger)) {}

void Responder::reply(const Id& id, const methods::HandlerOutcome& outcome) {
    if (!outcome.ok()) {
        reply_error(id, outcome.error());
        return;
    }
    send(id, codec::encode(SuccessResponse{id, outcome.result()}));
}

void Responder::reply_error(const Id& id, ErrorObject error) {
    send(id, codec::encode(ErrorResponse{id, std::move(error)}));
}

void Responder::reply_parse_error() {
    reply_error(kParseErrorId, make_error(ErrorCode::ParseError, "Parse error"));
}

void Responder::send(const Id& id, const nlohmann::json& message) {
    std::string text;
    try {
        // dump() without indentation never emits a raw newline
        text = message.dump();
    } catch (const nlohmann::json::exception& exc) {
        LOG4CPLUS_ERROR(logger_, "Error serializing response for id=" << codec::id_to_string(id) << ": " << exc.what());
        // the request still gets its one reply; replace mode cannot throw
        ErrorResponse fallback{id, make_error(ErrorCode::InternalError, "Internal error: response could not be serialized")};
        text = codec::encode(fallback).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    LOG4CPLUS_INFO(logger_, "Sending response: " << text);
    writer_.write_line(text);
}

} // namespace mcp
