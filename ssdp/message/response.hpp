#pragma once

#include "ssdp/message/parsed_request.hpp"

#include <boost/asio/ip/udp.hpp>

#include <string>

namespace ssdp
{

class Device;

enum class NotifyKind
{
    alive,
    byebye,
};

inline const char* to_string(NotifyKind kind) noexcept
{
    switch (kind)
    {
    case NotifyKind::alive:
        return "ssdp:alive";
    case NotifyKind::byebye:
        return "ssdp:byebye";
    }
    return "unknown";
}

/**
 * @brief An outgoing message.
 *
 * Either a real response (status line) or a multicast announcement sent as
 * `NOTIFY * HTTP/1.1`. Immutable once built.
 */
class Response
{
public:
    Response(const boost::asio::ip::udp::endpoint& destination, int status_code, Headers headers, std::string body = {});

    /// Build an announcement; its start line is `<method> * HTTP/1.1`.
    static Response announcement(const boost::asio::ip::udp::endpoint& destination, const std::string& method, Headers headers);

    const boost::asio::ip::udp::endpoint& destination() const { return _destination; }
    int status_code() const { return _status_code; }
    const std::string& method() const { return _method; }
    const Headers& headers() const { return _headers; }
    const std::string& body() const { return _body; }

    /// Serialize start line, headers in order, blank line and body.
    std::string encode() const;

private:
    boost::asio::ip::udp::endpoint _destination;
    int _status_code;
    std::string _method;
    Headers _headers;
    std::string _body;
};

const char* reason_phrase(int status_code) noexcept;

/// 200 reply to an M-SEARCH for `device`, addressed to the requester.
Response make_search_response(const Device& device, const boost::asio::ip::udp::endpoint& requester);

/// NOTIFY announcement of `device` to the multicast group.
Response make_notify(const Device& device, NotifyKind kind, const boost::asio::ip::udp::endpoint& multicast_group);

} // namespace ssdp
