#pragma once

#include <boost/asio/ip/udp.hpp>
#include <boost/system/error_code.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ssdp
{

using Header  = std::pair<std::string, std::string>;
using Headers = std::vector<Header>;

/**
 * @brief An HTTP/1.1-style request read from a single datagram.
 *
 * Headers keep the order, count and casing they were received with.
 */
struct ParsedRequest
{
    static constexpr std::size_t max_headers = 32;

    boost::asio::ip::udp::endpoint remote_endpoint; ///< Sender of the datagram
    std::string method;                             ///< e.g. "M-SEARCH" or "NOTIFY"
    std::string path;                               ///< Usually "*"
    int version_minor = 1;                          ///< The x in HTTP/1.x
    Headers headers;                                ///< (name, value) pairs as received
    std::string body;                               ///< Bytes after the header block, lossily decoded

    /**
     * @brief Parse request line, headers and body from one datagram.
     * @param remote_endpoint Sender of the datagram.
     * @param data Datagram payload.
     * @param size Payload size in bytes.
     * @param error_code Set to error::incomplete when the payload ends before the blank line closing
     *        the header block, or to one of the grammar errors (see error::is_parse_error()).
     * @return The parsed request, or std::nullopt on failure.
     */
    static std::optional<ParsedRequest> parse(const boost::asio::ip::udp::endpoint& remote_endpoint, const char* data, std::size_t size,
                                              boost::system::error_code& error_code);

    static std::optional<ParsedRequest> parse(const boost::asio::ip::udp::endpoint& remote_endpoint, const std::string& data,
                                              boost::system::error_code& error_code)
    {
        return parse(remote_endpoint, data.data(), data.size(), error_code);
    }

    /// True if a header named `name` (any case) has a value containing `substring`.
    bool header_contains(const std::string& name, const std::string& substring) const;

    /// True if a header named `name` (any case) has a value equal to `value`, ignoring case.
    bool header_match(const std::string& name, const std::string& value) const;

    /// First value of the header named `name` (any case).
    std::optional<std::string> header_value(const std::string& name) const;
};

} // namespace ssdp
