#pragma once

#include "ssdp/message/parsed_request.hpp"

#include <boost/asio/ip/udp.hpp>

#include <optional>
#include <string>

namespace ssdp
{

/**
 * @brief One received datagram: sender plus the untouched payload.
 */
class RawMessage
{
public:
    RawMessage(const boost::asio::ip::udp::endpoint& remote_endpoint, std::string data)
        : _remote_endpoint(remote_endpoint), _data(std::move(data))
    {
    }

    const boost::asio::ip::udp::endpoint& remote_endpoint() const { return _remote_endpoint; }
    const std::string& data() const { return _data; }

    std::optional<ParsedRequest> parse(boost::system::error_code& error_code) const
    {
        return ParsedRequest::parse(_remote_endpoint, _data, error_code);
    }

private:
    boost::asio::ip::udp::endpoint _remote_endpoint;
    std::string _data;
};

} // namespace ssdp
