#pragma once

#include "ssdp/device/device.hpp"

#include <boost/system/error_code.hpp>

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ssdp
{

/**
 * @brief Devices advertised by this host, keyed by USN.
 *
 * All members are thread safe. Readers get copies, so every result is a
 * consistent point-in-time view.
 */
class DeviceRegistry
{
public:
    /// Search target that matches every device.
    static constexpr const char* search_all = "ssdp:all";

    DeviceRegistry() = default;

    DeviceRegistry(const DeviceRegistry&)            = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    /**
     * @brief Add a device.
     * @return error::duplicate_usn if the USN is taken, error::invalid_device if it is empty.
     */
    boost::system::error_code register_device(const Device& device);

    /// Remove a device. Returns false if no device had that USN.
    bool deregister_device(const std::string& usn);

    /// Remove a device and return it, or nothing if no device had that USN.
    std::optional<Device> take(const std::string& usn);

    /// Devices whose search target equals `search_target`, or all of them for "ssdp:all".
    std::vector<Device> find_matching(const std::string& search_target) const;

    std::optional<Device> find(const std::string& usn) const;

    std::vector<Device> snapshot() const;

    std::size_t size() const;

    void clear();

private:
    mutable std::mutex _mutex;
    std::map<std::string, Device> _devices;
};

} // namespace ssdp
