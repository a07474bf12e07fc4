#include "ssdp/message/ssdp_error.hpp"

#include <string>

namespace ssdp
{
namespace error
{
namespace
{

class SsdpCategory : public boost::system::error_category
{
public:
    const char* name() const noexcept override { return "ssdp"; }

    std::string message(int value) const override
    {
        switch (static_cast<errc>(value))
        {
        case incomplete:
            return "datagram ends before the header block is complete";
        case invalid_method:
            return "invalid request method";
        case invalid_path:
            return "invalid request path";
        case invalid_version:
            return "invalid HTTP version";
        case invalid_header_name:
            return "invalid header name";
        case invalid_header_value:
            return "invalid header value";
        case too_many_headers:
            return "too many headers";
        case duplicate_usn:
            return "a device with this USN is already registered";
        case invalid_device:
            return "device is missing a USN";
        case bind_failed:
            return "could not bind or join the multicast group";
        case already_started:
            return "server is not stopped";
        case server_stopping:
            return "server is stopping";
        }
        return "unknown ssdp error";
    }
};

} // namespace

const boost::system::error_category& get_category() noexcept
{
    static const SsdpCategory category;
    return category;
}

bool is_parse_error(const boost::system::error_code& error_code) noexcept
{
    if (error_code.category() != get_category())
    {
        return false;
    }

    switch (static_cast<errc>(error_code.value()))
    {
    case invalid_method:
    case invalid_path:
    case invalid_version:
    case invalid_header_name:
    case invalid_header_value:
    case too_many_headers:
        return true;
    default:
        return false;
    }
}

} // namespace error
} // namespace ssdp
