#pragma once

#include <string>
#include <log4cplus/logger.h>

log4cplus::Logger& core_logger();
log4cplus::Logger& rpc_logger();
log4cplus::Logger& transport_logger();
void init_logging(const std::string& config_path);
