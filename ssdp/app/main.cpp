#include "ssdp_device_cli.hpp"
#include "ssdp/logging/ssdp_logging.hpp"
#include "ssdp/net/ssdp_server.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options/errors.hpp>

#include <csignal>
#include <exception>

int main(int argc, char* argv[])
{
    std::optional<ssdp::SsdpDeviceConfig> config;
    try
    {
        config = ssdp::parse_command_line(argc, argv);
    }
    catch (const boost::program_options::error&)
    {
        return 1;
    }

    if (!config)
    {
        return 0;
    }
    ssdp::logging::current_log_level = config->log_level;

    try
    {
        boost::asio::io_context io_context;
        ssdp::SsdpServer server(io_context, config->server);

        auto error_code =
            server.add_device(ssdp::Device(config->usn, config->search_target, config->location, config->max_age, config->server_string));
        if (error_code)
        {
            SSDP_LOG_ERROR("Could not register device: " << error_code.message());
            return 1;
        }

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        // The server also stops on its own when the socket fails; stop waiting for signals then
        server.set_stopped_callback(
            [&signals]()
            {
                boost::system::error_code cancel_error;
                signals.cancel(cancel_error);
                if (cancel_error)
                {
                    SSDP_LOG_ERROR("Could not cancel signal wait: " << cancel_error.message());
                }
            });

        error_code = server.async_start();
        if (error_code)
        {
            SSDP_LOG_ERROR("Could not start: " << error_code.message());
            return 1;
        }

        signals.async_wait(
            [&server](const boost::system::error_code& signal_error, int signal_number)
            {
                if (signal_error)
                {
                    return;
                }
                SSDP_LOG_INFO("Received signal " << signal_number << ", shutting down");
                if (!server.async_stop([]() { SSDP_LOG_DEBUG("Shutdown complete"); }))
                {
                    SSDP_LOG_WARNING("Server was not running");
                }
            });

        // Returns once the server has stopped and no work is left
        io_context.run();
    }
    catch (const std::exception& exception)
    {
        SSDP_LOG_ERROR("Fatal: " << exception.what());
        return 1;
    }

    return 0;
}
