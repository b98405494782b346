#pragma once

#include <log4cplus/logger.h>

#include <cstddef>
#include <functional>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>

namespace mcp {

/// The output side can no longer be written to. Fatal for the session.
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class LineWriter {
public:
    virtual ~LineWriter() = default;

    /// Write one complete line and make it visible to the peer before returning.
    virtual void write_line(const std::string& line) = 0;
};

class StreamLineWriter final : public LineWriter {
public:
    explicit StreamLineWriter(std::ostream& out) : out_(out) {}

    void write_line(const std::string& line) override;

private:
    std::ostream& out_;
};

/// Turn SIGPIPE into EPIPE so a closed peer surfaces as a TransportError.
void ignore_broken_pipe();

class StdioTransport {
public:
    /// Line handler type; it may throw TransportError to end the session.
    using LineHandler = std::function<void(const std::string& line)>;

    /**
     * Construct a transport over an input stream.
     *
     * @param in Source of newline-delimited messages
     * @param handler Called once per line, in arrival order
     * @param logger Destination for diagnostics about the loop itself
     */
    StdioTransport(std::istream& in, LineHandler handler, log4cplus::Logger logger);

    /// Read until end of stream. Returns the number of lines handled.
    size_t run();

private:
    std::istream& in_;
    LineHandler handler_;
    log4cplus::Logger logger_;
};

} // namespace mcp
