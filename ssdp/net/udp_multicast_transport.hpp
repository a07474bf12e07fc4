#pragma once

#include "ssdp/net/datagram_transport.hpp"
#include "ssdp/net/server_config.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>

#include <vector>

namespace ssdp
{

class UdpMulticastTransport : public DatagramTransport
{
public:
    UdpMulticastTransport(boost::asio::io_context& io_context, const ServerConfig& config);
    ~UdpMulticastTransport() override;

    UdpMulticastTransport(const UdpMulticastTransport&)            = delete;
    UdpMulticastTransport& operator=(const UdpMulticastTransport&) = delete;

    void open(boost::system::error_code& error_code) override;
    bool is_open() const override { return _socket.is_open(); }

    void async_receive(ReceiveHandler handler) override;
    void async_send_to(std::shared_ptr<const std::string> data, const boost::asio::ip::udp::endpoint& destination,
                       SendHandler handler) override;

    void cancel() override;
    void close() override;

    boost::asio::ip::udp::endpoint multicast_endpoint() const override { return _multicast_endpoint; }

private:
    ServerConfig _config;
    boost::asio::ip::udp::socket _socket;
    boost::asio::ip::udp::endpoint _remote_endpoint;
    boost::asio::ip::udp::endpoint _multicast_endpoint;
    std::vector<char> _recv_buffer;
};

} // namespace ssdp
