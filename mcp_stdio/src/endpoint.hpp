#pragma once

#include "method/dispatcher.hpp"
#include "responder.hpp"

#include <log4cplus/logger.h>

#include <string>

namespace mcp {

class Endpoint {
public:
    Endpoint(methods::Dispatcher& dispatcher, Responder& responder, log4cplus::Logger logger);

    /// Classify, dispatch and answer one input line.
    void handle_line(const std::string& line);

private:
    methods::Dispatcher& dispatcher_;
    Responder& responder_;
    log4cplus::Logger logger_;
};

} // namespace mcp
