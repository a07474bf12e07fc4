#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace ssdp
{

struct ServerConfig
{
    static constexpr unsigned short default_port = 1900;

    std::string multicast_address = "239.255.255.250";
    unsigned short port           = default_port;
    std::string listen_address    = "0.0.0.0"; // use "::" together with an IPv6 group
    std::chrono::seconds announce_interval {900};
    int multicast_ttl                = 2;
    bool multicast_loopback          = true;
    std::size_t receive_buffer_size  = 2048;
};

} // namespace ssdp
