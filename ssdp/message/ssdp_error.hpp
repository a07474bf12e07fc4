#pragma once

#include <boost/system/error_code.hpp>

#include <type_traits>

namespace ssdp
{
namespace error
{

/**
 * @brief Error values reported by the ssdp library.
 *
 * Parser errors split into `incomplete` (the datagram ended before the header
 * block did) and the grammar errors, see is_parse_error().
 */
enum errc
{
    incomplete = 1,
    invalid_method,
    invalid_path,
    invalid_version,
    invalid_header_name,
    invalid_header_value,
    too_many_headers,
    duplicate_usn,
    invalid_device,
    bind_failed,
    already_started,
    server_stopping,
};

const boost::system::error_category& get_category() noexcept;

inline boost::system::error_code make_error_code(errc value) noexcept
{
    return boost::system::error_code(static_cast<int>(value), get_category());
}

/// True for grammar violations, false for `incomplete` and everything else.
bool is_parse_error(const boost::system::error_code& error_code) noexcept;

} // namespace error
} // namespace ssdp

namespace boost
{
namespace system
{
template <>
struct is_error_code_enum<ssdp::error::errc> : std::true_type
{
};
} // namespace system
} // namespace boost
