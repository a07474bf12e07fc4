#include "ssdp/device/device_registry.hpp"
#include "ssdp/logging/ssdp_logging.hpp"
#include "ssdp/message/ssdp_error.hpp"

namespace ssdp
{

boost::system::error_code DeviceRegistry::register_device(const Device& device)
{
    if (device.usn().empty())
    {
        return error::invalid_device;
    }

    std::lock_guard<std::mutex> lock(_mutex);
    if (!_devices.emplace(device.usn(), device).second)
    {
        SSDP_LOG_DEBUG("USN already registered: " << device.usn());
        return error::duplicate_usn;
    }

    SSDP_LOG_DEBUG("Registered " << device.usn() << " (" << device.search_target() << ")");
    return {};
}

bool DeviceRegistry::deregister_device(const std::string& usn)
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _devices.erase(usn) != 0U;
}

std::optional<Device> DeviceRegistry::take(const std::string& usn)
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto found = _devices.find(usn);
    if (found == _devices.end())
    {
        return std::nullopt;
    }

    Device device = std::move(found->second);
    _devices.erase(found);
    return device;
}

std::vector<Device> DeviceRegistry::find_matching(const std::string& search_target) const
{
    const bool match_all = search_target == search_all;

    std::vector<Device> matches;
    std::lock_guard<std::mutex> lock(_mutex);
    for (const auto& entry : _devices)
    {
        if (match_all || entry.second.search_target() == search_target)
        {
            matches.push_back(entry.second);
        }
    }
    return matches;
}

std::optional<Device> DeviceRegistry::find(const std::string& usn) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto iter = _devices.find(usn);
    if (iter == _devices.end())
    {
        return std::nullopt;
    }
    return iter->second;
}

std::vector<Device> DeviceRegistry::snapshot() const
{
    return find_matching(search_all);
}

std::size_t DeviceRegistry::size() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _devices.size();
}

void DeviceRegistry::clear()
{
    std::lock_guard<std::mutex> lock(_mutex);
    _devices.clear();
}

} // namespace ssdp
