#include "ssdp/net/udp_multicast_transport.hpp"
#include "ssdp/logging/ssdp_logging.hpp"

#include <boost/asio/ip/multicast.hpp>

#include <utility>

namespace ssdp
{

UdpMulticastTransport::UdpMulticastTransport(boost::asio::io_context& io_context, const ServerConfig& config)
    : _config(config), _socket(io_context), _recv_buffer(config.receive_buffer_size)
{
}

UdpMulticastTransport::~UdpMulticastTransport()
{
    close();
}

void UdpMulticastTransport::open(boost::system::error_code& error_code)
{
    auto group = boost::asio::ip::make_address(_config.multicast_address, error_code);
    if (error_code)
    {
        SSDP_LOG_ERROR("Invalid multicast address '" << _config.multicast_address << "': " << error_code.message());
        return;
    }

    auto listen_address = boost::asio::ip::make_address(_config.listen_address, error_code);
    if (error_code)
    {
        SSDP_LOG_ERROR("Invalid listen address '" << _config.listen_address << "': " << error_code.message());
        return;
    }

    boost::asio::ip::udp::endpoint listen_endpoint(listen_address, _config.port);
    _multicast_endpoint = boost::asio::ip::udp::endpoint(group, _config.port);

    // Every step below must succeed, so stop at the first failure
    _socket.open(listen_endpoint.protocol(), error_code);
    if (!error_code)
    {
        _socket.set_option(boost::asio::ip::udp::socket::reuse_address(true), error_code);
    }
    if (!error_code)
    {
        _socket.bind(listen_endpoint, error_code);
    }
    if (!error_code)
    {
        _socket.set_option(boost::asio::ip::multicast::join_group(group), error_code);
    }
    if (!error_code)
    {
        _socket.set_option(boost::asio::ip::multicast::hops(_config.multicast_ttl), error_code);
    }
    if (!error_code)
    {
        _socket.set_option(boost::asio::ip::multicast::enable_loopback(_config.multicast_loopback), error_code);
    }

    if (error_code)
    {
        SSDP_LOG_ERROR("Failed to open multicast socket on " << listen_endpoint << " for group " << group << ": "
                                                             << error_code.message());
        close();
        return;
    }

    SSDP_LOG_INFO("Listening on " << listen_endpoint << ", joined " << _multicast_endpoint);
}

void UdpMulticastTransport::async_receive(ReceiveHandler handler)
{
    _socket.async_receive_from(boost::asio::buffer(_recv_buffer), _remote_endpoint,
                               [this, handler = std::move(handler)](const boost::system::error_code& error_code, std::size_t bytes)
                               { handler(error_code, RawMessage(_remote_endpoint, std::string(_recv_buffer.data(), bytes))); });
}

void UdpMulticastTransport::async_send_to(std::shared_ptr<const std::string> data, const boost::asio::ip::udp::endpoint& destination,
                                          SendHandler handler)
{
    auto buffer = boost::asio::buffer(*data);
    _socket.async_send_to(buffer, destination,
                          [data = std::move(data), handler = std::move(handler)](const boost::system::error_code& error_code,
                                                                                  std::size_t bytes) { handler(error_code, bytes); });
}

void UdpMulticastTransport::cancel()
{
    if (!_socket.is_open())
    {
        return;
    }

    boost::system::error_code error_code;
    _socket.cancel(error_code);
    if (error_code)
    {
        SSDP_LOG_ERROR("Failed to cancel socket operations: " << error_code.message());
    }
}

void UdpMulticastTransport::close()
{
    if (!_socket.is_open())
    {
        return;
    }

    boost::system::error_code error_code;
    _socket.close(error_code);
    if (error_code)
    {
        SSDP_LOG_ERROR("Failed to close socket: " << error_code.message());
    }
}

} // namespace ssdp
