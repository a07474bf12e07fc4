#pragma once

#include <chrono>
#include <string>

#include "ssdp/device/device.hpp"
#include "ssdp/logging/ssdp_logging.hpp"
#include "ssdp/net/server_config.hpp"

namespace ssdp
{

struct SsdpDeviceConfig
{
    ServerConfig server;
    std::string usn;
    std::string search_target;
    std::string location;
    std::chrono::seconds max_age = Device::default_max_age;
    std::string server_string    = Device::default_server();
    logging::LogLevel log_level  = logging::LogLevel::Info;
};

} // namespace ssdp
