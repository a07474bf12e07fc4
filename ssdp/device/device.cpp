#include "ssdp/device/device.hpp"

#include <utility>

namespace ssdp
{

Device::Device(std::string usn, std::string search_target, std::string location, std::chrono::seconds max_age, std::string server)
    : _usn(std::move(usn))
    , _search_target(std::move(search_target))
    , _location(std::move(location))
    , _max_age(max_age)
    , _server(std::move(server))
{
}

std::string Device::default_server()
{
#if defined(_WIN32)
    const char* os = "Windows";
#elif defined(__APPLE__)
    const char* os = "Darwin";
#else
    const char* os = "Linux";
#endif
    return std::string(os) + "/1.0 UPnP/1.1 ssdp/1.0";
}

} // namespace ssdp
