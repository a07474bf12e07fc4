#pragma once

#include "ssdp_device_config.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ssdp
{

/**
 * @brief Parse the ssdp_device command line.
 * @return The configuration, or std::nullopt when only help was requested.
 * @throws boost::program_options::error on invalid or missing options.
 */
std::optional<SsdpDeviceConfig> parse_command_line(const std::vector<std::string>& arguments);

std::optional<SsdpDeviceConfig> parse_command_line(int argc, char* argv[]);

} // namespace ssdp
