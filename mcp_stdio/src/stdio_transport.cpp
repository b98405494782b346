#include "stdio_transport.hpp"

#include <log4cplus/loggingmacros.h>

#include <signal.h>

namespace mcp {

void StreamLineWriter::write_line(const std::string& line) {
    if (!out_) {
        throw TransportError("output stream is not writable");
    }
    out_ << line << '\n';
    out_.flush();
    if (!out_) {
        throw TransportError("failed to write response to output stream");
    }
}

void ignore_broken_pipe() {
    ::signal(SIGPIPE, SIG_IGN);
}

StdioTransport::StdioTransport(std::istream& in, LineHandler handler, log4cplus::Logger logger)
    : in_(in),
      handler_(std::move(handler)),
      logger_(std::move(logger)) {}

size_t StdioTransport::run() {
    size_t handled = 0;
    std::string line;

    while (std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        try {
            handler_(line);
        } catch (const TransportError&) {
            throw;
        } catch (const std::exception& e) {
            LOG4CPLUS_ERROR(logger_, "Line handler error: " << e.what());
        } catch (...) {
            LOG4CPLUS_ERROR(logger_, "Line handler failed with a non-standard exception");
        }
        ++handled;
    }

    if (in_.bad()) {
        LOG4CPLUS_WARN(logger_, "Input stream failed after " << handled << " lines");
    } else {
        LOG4CPLUS_INFO(logger_, "End of input after " << handled << " lines");
    }
    return handled;
}

} // namespace mcp
