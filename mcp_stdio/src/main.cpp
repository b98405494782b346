#include "endpoint.hpp"
#include "logger.hpp"
#include "method/dispatcher.hpp"
#include "method/method_registry.hpp"
#include "responder.hpp"
#include "server_context.hpp"
#include "stdio_transport.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <cstring>
#include <iostream>
#include <string>

#include <signal.h>
#include <sys/prctl.h>
#include <unistd.h>

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    bool enable_pdeathsig = false;
    std::string config_path = "log4cplus.ini";
    std::string protocol_version = kDefaultProtocolVersion;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "Version: " << VERSION_STRING << std::endl;
            std::cout << "Commit: " << GIT_VERSION_STRING << std::endl;
            std::cout << "Build Time: " << BUILD_TIMESTAMP << std::endl;
            return 0;
        }

        if (strcmp(argv[i], "--pdeathsig") == 0) {
            enable_pdeathsig = true;
            continue;
        }

        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
            continue;
        }

        if (strncmp(argv[i], "--config=", 9) == 0) {
            config_path = argv[i] + 9;
            continue;
        }

        if (strcmp(argv[i], "--protocol-version") == 0 && i + 1 < argc) {
            protocol_version = argv[++i];
            continue;
        }

        if (strncmp(argv[i], "--protocol-version=", 19) == 0) {
            protocol_version = argv[i] + 19;
            continue;
        }

        std::cerr << "Unknown argument: " << argv[i] << std::endl;
        return 2;
    }

#ifdef __linux__
    if (enable_pdeathsig) {
        prctl(PR_SET_PDEATHSIG, SIGTERM);
        if (getppid() == 1) {
            return 1;
        }
    }
#endif

    init_logging(config_path);

    LOG4CPLUS_INFO(core_logger(), "mcp_stdio starting");
    LOG4CPLUS_INFO(core_logger(), "Version: " << VERSION_STRING << ", Commit: " << GIT_VERSION_STRING);
    LOG4CPLUS_INFO(core_logger(), "Build Time: " << BUILD_TIMESTAMP);
    LOG4CPLUS_INFO(core_logger(), "Default protocol version: " << protocol_version);
    LOG4CPLUS_INFO(core_logger(), "Parent death signal: " << (enable_pdeathsig ? "enabled" : "disabled"));

    ServerContext context;
    context.server_info.version = VERSION_STRING;
    context.default_protocol_version = protocol_version;

    mcp::methods::MethodRegistry requests;
    mcp::methods::MethodRegistry notifications;
    mcp::methods::register_lifecycle_requests(requests);
    mcp::methods::register_lifecycle_notifications(notifications);

    mcp::StreamLineWriter writer(std::cout);
    mcp::Responder responder(writer, rpc_logger());
    mcp::methods::Dispatcher dispatcher(requests, notifications, context, rpc_logger());
    mcp::Endpoint endpoint(dispatcher, responder, rpc_logger());

    // a peer that closes its read end must reach the TransportError path below
    mcp::ignore_broken_pipe();

    mcp::StdioTransport transport(
        std::cin,
        [&endpoint](const std::string& line) { endpoint.handle_line(line); },
        transport_logger());

    try {
        transport.run();
    } catch (const mcp::TransportError& exc) {
        LOG4CPLUS_FATAL(core_logger(), "Output transport failed: " << exc.what());
        return 1;
    }

    LOG4CPLUS_INFO(core_logger(), "mcp_stdio exiting");
    return 0;
}
