#pragma once

#include <chrono>
#include <string>

namespace ssdp
{

/**
 * @brief A locally advertised device or service.
 *
 * Example: Device("uuid:1234::urn:example:device:1", "urn:example:device:1", "http://10.0.0.2:8080/desc.xml");
 */
class Device
{
public:
    static constexpr std::chrono::seconds default_max_age {1800};

    /**
     * @brief Describe a device.
     * @param usn Unique service name, the registry key.
     * @param search_target Device type used as ST in replies and NT in announcements.
     * @param location URL of the device description.
     * @param max_age Cache lifetime advertised in CACHE-CONTROL.
     * @param server SERVER header value.
     */
    Device(std::string usn, std::string search_target, std::string location, std::chrono::seconds max_age = default_max_age,
           std::string server = default_server());

    const std::string& usn() const { return _usn; }
    const std::string& search_target() const { return _search_target; }
    const std::string& location() const { return _location; }
    std::chrono::seconds max_age() const { return _max_age; }
    const std::string& server() const { return _server; }

    /// "<os>/1.0 UPnP/1.1 ssdp/1.0"
    static std::string default_server();

private:
    std::string _usn;
    std::string _search_target;
    std::string _location;
    std::chrono::seconds _max_age;
    std::string _server;
};

} // namespace ssdp
