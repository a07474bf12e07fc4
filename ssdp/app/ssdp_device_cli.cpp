#include "ssdp_device_cli.hpp"
#include "ssdp/logging/ssdp_logging.hpp"

#include <boost/program_options.hpp>
#include <iostream>

namespace ssdp
{
namespace
{

// Count of v's in a lone -v, -vv, ... argument
int verbosity_of(const std::vector<std::string>& arguments)
{
    for (std::size_t i = 1; i < arguments.size(); ++i)
    {
        const std::string& argument = arguments[i];
        if (argument.size() >= 2 && argument[0] == '-' && argument.find_first_not_of('v', 1) == std::string::npos)
        {
            return static_cast<int>(argument.size() - 1);
        }
    }
    return 0;
}

} // namespace

std::optional<SsdpDeviceConfig> parse_command_line(const std::vector<std::string>& arguments)
{
    namespace po = boost::program_options;

    SsdpDeviceConfig config;

    po::options_description desc("ssdp_device Options");
    // clang-format off
    desc.add_options()
        ("help,h", "Show help message")
        ("usn,u", po::value<std::string>()->required(), "Unique service name (required)")
        ("st,s", po::value<std::string>()->required(), "Search target / notification type (required)")
        ("location,l", po::value<std::string>()->required(), "Device description URL (required)")
        ("max-age", po::value<long>()->default_value(config.max_age.count()), "Advertised cache lifetime in seconds")
        ("server", po::value<std::string>()->default_value(config.server_string), "SERVER header value")
        ("group,g", po::value<std::string>()->default_value(config.server.multicast_address), "Multicast group address")
        ("port,p", po::value<unsigned short>()->default_value(config.server.port), "Multicast port")
        ("interface,i", po::value<std::string>()->default_value(config.server.listen_address), "Address to listen on")
        ("interval", po::value<long>()->default_value(config.server.announce_interval.count()), "Seconds between alive announcements")
        ("ttl", po::value<int>()->default_value(config.server.multicast_ttl), "Multicast TTL");
    // clang-format on

    po::variables_map variables;

    try
    {
        auto parser = po::command_line_parser(std::vector<std::string>(arguments.begin() + (arguments.empty() ? 0 : 1), arguments.end()))
                          .options(desc)
                          .allow_unregistered();
        po::store(parser.run(), variables);

        if (variables.count("help") != 0U)
        {
            std::cout << desc << '\n';
            std::cout << "\nVerbosity levels:\n"
                      << "  (none)  : Info level  - shows ERROR, WARNING and INFO messages\n"
                      << "  -v      : Debug level - also shows DEBUG messages\n"
                      << "  -vv     : Trace level - shows all messages, including every datagram sent\n";
            return std::nullopt;
        }

        po::notify(variables);

        const long max_age  = variables["max-age"].as<long>();
        const long interval = variables["interval"].as<long>();
        if (max_age <= 0)
        {
            throw po::error("--max-age must be positive.");
        }
        if (interval <= 0)
        {
            throw po::error("--interval must be positive.");
        }

        config.usn                        = variables["usn"].as<std::string>();
        config.search_target              = variables["st"].as<std::string>();
        config.location                   = variables["location"].as<std::string>();
        config.max_age                    = std::chrono::seconds(max_age);
        config.server_string              = variables["server"].as<std::string>();
        config.server.multicast_address   = variables["group"].as<std::string>();
        config.server.port                = variables["port"].as<unsigned short>();
        config.server.listen_address      = variables["interface"].as<std::string>();
        config.server.announce_interval   = std::chrono::seconds(interval);
        config.server.multicast_ttl       = variables["ttl"].as<int>();

        const int verbosity = verbosity_of(arguments);
        if (verbosity == 0)
        {
            config.log_level = logging::LogLevel::Info;
        }
        else if (verbosity == 1)
        {
            config.log_level = logging::LogLevel::Debug;
        }
        else
        {
            config.log_level = logging::LogLevel::Trace;
        }

        SSDP_LOG_DEBUG("Verbosity level: " << verbosity);
        SSDP_LOG_INFO("Advertising " << config.usn << " as " << config.search_target << " at " << config.location);
        SSDP_LOG_TRACE("Command line arguments parsed successfully");
    }
    catch (const po::error& error)
    {
        SSDP_LOG_ERROR("Error parsing command line: " << error.what());
        std::cerr << "Error: " << error.what() << '\n';
        std::cerr << desc << '\n';
        throw;
    }

    return config;
}

std::optional<SsdpDeviceConfig> parse_command_line(int argc, char* argv[])
{
    std::vector<std::string> arguments;
    arguments.reserve(static_cast<std::size_t>(argc));
    for (int i = 0; i < argc; ++i)
    {
        arguments.emplace_back(argv[i]);
    }
    return parse_command_line(arguments);
}

} // namespace ssdp
