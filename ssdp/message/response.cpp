#include "ssdp/message/response.hpp"
#include "ssdp/device/device.hpp"

#include <sstream>
#include <utility>

namespace ssdp
{

Response::Response(const boost::asio::ip::udp::endpoint& destination, int status_code, Headers headers, std::string body)
    : _destination(destination), _status_code(status_code), _headers(std::move(headers)), _body(std::move(body))
{
}

Response Response::announcement(const boost::asio::ip::udp::endpoint& destination, const std::string& method, Headers headers)
{
    Response response(destination, 0, std::move(headers));
    response._method = method;
    return response;
}

std::string Response::encode() const
{
    std::ostringstream out;
    if (_method.empty())
    {
        out << "HTTP/1.1 " << _status_code << ' ' << reason_phrase(_status_code) << "\r\n";
    }
    else
    {
        out << _method << " * HTTP/1.1\r\n";
    }

    for (const auto& header : _headers)
    {
        out << header.first << ':';
        if (!header.second.empty())
        {
            out << ' ' << header.second;
        }
        out << "\r\n";
    }
    out << "\r\n" << _body;

    return out.str();
}

const char* reason_phrase(int status_code) noexcept
{
    switch (status_code)
    {
    case 200:
        return "OK";
    case 400:
        return "Bad Request";
    case 404:
        return "Not Found";
    case 412:
        return "Precondition Failed";
    case 500:
        return "Internal Server Error";
    default:
        return "Unknown";
    }
}

namespace
{

std::string cache_control(const Device& device)
{
    return "max-age=" + std::to_string(device.max_age().count());
}

std::string host_header(const boost::asio::ip::udp::endpoint& group)
{
    if (group.address().is_v6())
    {
        return "[" + group.address().to_string() + "]:" + std::to_string(group.port());
    }
    return group.address().to_string() + ":" + std::to_string(group.port());
}

} // namespace

Response make_search_response(const Device& device, const boost::asio::ip::udp::endpoint& requester)
{
    return Response(requester, 200,
                    {{"CACHE-CONTROL", cache_control(device)},
                     {"EXT", ""},
                     {"LOCATION", device.location()},
                     {"SERVER", device.server()},
                     {"ST", device.search_target()},
                     {"USN", device.usn()}});
}

Response make_notify(const Device& device, NotifyKind kind, const boost::asio::ip::udp::endpoint& multicast_group)
{
    Headers headers;
    headers.emplace_back("HOST", host_header(multicast_group));
    if (kind == NotifyKind::alive)
    {
        headers.emplace_back("CACHE-CONTROL", cache_control(device));
        headers.emplace_back("LOCATION", device.location());
    }
    headers.emplace_back("NT", device.search_target());
    headers.emplace_back("NTS", to_string(kind));
    if (kind == NotifyKind::alive)
    {
        headers.emplace_back("SERVER", device.server());
    }
    headers.emplace_back("USN", device.usn());

    return Response::announcement(multicast_group, "NOTIFY", std::move(headers));
}

} // namespace ssdp
