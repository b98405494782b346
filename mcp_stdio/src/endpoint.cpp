#include "endpoint.hpp"

#include "classifier.hpp"

#include <log4cplus/loggingmacros.h>

namespace mcp {

Endpoint::Endpoint(methods::Dispatcher& dispatcher, Responder& responder, log4cplus::Logger logger)
    : dispatcher_(dispatcher),
      responder_(responder),
      logger_(std::move(logger)) {}

void Endpoint::handle_line(const std::string& line) {
    LOG4CPLUS_INFO(logger_, "Received line: " << line);

    Message message = classify(line);

    if (auto* request = std::get_if<Request>(&message)) {
        responder_.reply(request->id, dispatcher_.dispatch(*request));
        return;
    }

    if (auto* notification = std::get_if<Notification>(&message)) {
        dispatcher_.dispatch(*notification);
        return;
    }

    LOG4CPLUS_ERROR(logger_, "Error parsing request: " << std::get<ParseFailure>(message).reason);
    responder_.reply_parse_error();
}

} // namespace mcp
