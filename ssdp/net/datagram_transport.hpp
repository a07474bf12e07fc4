#pragma once

#include "ssdp/message/raw_message.hpp"

#include <boost/asio/ip/udp.hpp>
#include <boost/system/error_code.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace ssdp
{

/**
 * @brief Datagram socket as seen by the server.
 *
 * Completion handlers are always dispatched through the owning io_context,
 * never from inside the initiating call. At most one receive is outstanding.
 */
class DatagramTransport
{
public:
    using ReceiveHandler = std::function<void(const boost::system::error_code&, RawMessage)>;
    using SendHandler    = std::function<void(const boost::system::error_code&, std::size_t)>;

    virtual ~DatagramTransport() = default;

    /// Bind and join the multicast group.
    virtual void open(boost::system::error_code& error_code) = 0;

    virtual bool is_open() const = 0;

    virtual void async_receive(ReceiveHandler handler) = 0;

    /// `data` is kept alive until the handler runs.
    virtual void async_send_to(std::shared_ptr<const std::string> data, const boost::asio::ip::udp::endpoint& destination,
                               SendHandler handler) = 0;

    /// Abort outstanding operations; their handlers get operation_aborted.
    virtual void cancel() = 0;

    virtual void close() = 0;

    /// Group address and port announcements go to. Valid once open.
    virtual boost::asio::ip::udp::endpoint multicast_endpoint() const = 0;
};

} // namespace ssdp
