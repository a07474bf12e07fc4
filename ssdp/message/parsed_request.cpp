#include "ssdp/message/parsed_request.hpp"
#include "ssdp/message/ssdp_error.hpp"
#include "ssdp/message/utf8.hpp"

#include <boost/algorithm/string/predicate.hpp>

#include <cstring>

namespace ssdp
{
namespace
{

bool is_token_char(unsigned char c)
{
    if ((c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'))
    {
        return true;
    }
    return c != '\0' && std::strchr("!#$%&'*+-.^_`|~", c) != nullptr;
}

bool is_path_char(unsigned char c)
{
    return c > 0x20 && c != 0x7F;
}

bool is_value_char(unsigned char c)
{
    return c == '\t' || (c >= 0x20 && c != 0x7F);
}

/**
 * Walks one datagram. Every reader returns false with the error code set; running out
 * of bytes is always error::incomplete so a truncated but otherwise valid datagram
 * never reports a grammar error.
 */
class RequestReader
{
public:
    RequestReader(const char* data, std::size_t size) : _data(data), _size(size) { }

    bool at_end() const { return _pos >= _size; }
    std::size_t position() const { return _pos; }
    unsigned char peek() const { return static_cast<unsigned char>(_data[_pos]); }

    bool skip_empty_lines(boost::system::error_code& error_code)
    {
        while (!at_end() && (peek() == '\r' || peek() == '\n'))
        {
            if (!read_newline(error::invalid_method, error_code))
            {
                return false;
            }
        }
        return true;
    }

    bool read_token(std::string& out, char terminator, error::errc on_error, boost::system::error_code& error_code)
    {
        const std::size_t start = _pos;
        while (!at_end() && is_token_char(peek()))
        {
            ++_pos;
        }
        return finish_field(start, out, terminator, on_error, error_code);
    }

    bool read_path(std::string& out, boost::system::error_code& error_code)
    {
        const std::size_t start = _pos;
        while (!at_end() && is_path_char(peek()))
        {
            ++_pos;
        }
        return finish_field(start, out, ' ', error::invalid_path, error_code);
    }

    bool read_version(int& minor, boost::system::error_code& error_code)
    {
        static constexpr char prefix[] = "HTTP/1.";
        for (std::size_t i = 0; i < sizeof(prefix) - 1; ++i)
        {
            if (at_end())
            {
                error_code = error::incomplete;
                return false;
            }
            if (peek() != static_cast<unsigned char>(prefix[i]))
            {
                error_code = error::invalid_version;
                return false;
            }
            ++_pos;
        }

        if (at_end())
        {
            error_code = error::incomplete;
            return false;
        }
        if (peek() < '0' || peek() > '9')
        {
            error_code = error::invalid_version;
            return false;
        }
        minor = peek() - '0';
        ++_pos;

        return read_newline(error::invalid_version, error_code);
    }

    bool read_header(Header& header, boost::system::error_code& error_code)
    {
        if (!read_token(header.first, ':', error::invalid_header_name, error_code))
        {
            return false;
        }

        while (!at_end() && (peek() == ' ' || peek() == '\t'))
        {
            ++_pos;
        }

        const std::size_t start = _pos;
        while (!at_end() && peek() != '\r' && peek() != '\n')
        {
            if (!is_value_char(peek()))
            {
                error_code = error::invalid_header_value;
                return false;
            }
            ++_pos;
        }

        std::size_t end = _pos;
        while (end > start && (_data[end - 1] == ' ' || _data[end - 1] == '\t'))
        {
            --end;
        }

        if (!read_newline(error::invalid_header_value, error_code))
        {
            return false;
        }

        header.second = decode_utf8_lossy(_data + start, end - start);
        return true;
    }

    /// Accepts CRLF or a bare LF.
    bool read_newline(error::errc on_error, boost::system::error_code& error_code)
    {
        if (at_end())
        {
            error_code = error::incomplete;
            return false;
        }
        if (peek() == '\n')
        {
            ++_pos;
            return true;
        }
        if (peek() != '\r')
        {
            error_code = on_error;
            return false;
        }
        if (_pos + 1 >= _size)
        {
            error_code = error::incomplete;
            return false;
        }
        if (_data[_pos + 1] != '\n')
        {
            error_code = on_error;
            return false;
        }
        _pos += 2;
        return true;
    }

private:
    bool finish_field(std::size_t start, std::string& out, char terminator, error::errc on_error, boost::system::error_code& error_code)
    {
        if (at_end())
        {
            error_code = error::incomplete;
            return false;
        }
        if (_pos == start || peek() != static_cast<unsigned char>(terminator))
        {
            error_code = on_error;
            return false;
        }
        out.assign(_data + start, _pos - start);
        ++_pos;
        return true;
    }

    const char* _data;
    std::size_t _size;
    std::size_t _pos = 0;
};

} // namespace

std::optional<ParsedRequest> ParsedRequest::parse(const boost::asio::ip::udp::endpoint& remote_endpoint, const char* data, std::size_t size,
                                                  boost::system::error_code& error_code)
{
    error_code.clear();

    ParsedRequest request;
    request.remote_endpoint = remote_endpoint;

    RequestReader reader(data, size);
    if (!reader.skip_empty_lines(error_code) || !reader.read_token(request.method, ' ', error::invalid_method, error_code) ||
        !reader.read_path(request.path, error_code) || !reader.read_version(request.version_minor, error_code))
    {
        return std::nullopt;
    }

    for (;;)
    {
        if (reader.at_end())
        {
            error_code = error::incomplete;
            return std::nullopt;
        }

        if (reader.peek() == '\r' || reader.peek() == '\n')
        {
            if (!reader.read_newline(error::invalid_header_name, error_code))
            {
                return std::nullopt;
            }
            break;
        }

        if (request.headers.size() == max_headers)
        {
            error_code = error::too_many_headers;
            return std::nullopt;
        }

        Header header;
        if (!reader.read_header(header, error_code))
        {
            return std::nullopt;
        }
        request.headers.push_back(std::move(header));
    }

    if (reader.position() < size)
    {
        request.body = decode_utf8_lossy(data + reader.position(), size - reader.position());
    }

    return request;
}

bool ParsedRequest::header_contains(const std::string& name, const std::string& substring) const
{
    for (const auto& header : headers)
    {
        if (boost::algorithm::iequals(header.first, name) && header.second.find(substring) != std::string::npos)
        {
            return true;
        }
    }
    return false;
}

bool ParsedRequest::header_match(const std::string& name, const std::string& value) const
{
    for (const auto& header : headers)
    {
        if (boost::algorithm::iequals(header.first, name) && boost::algorithm::iequals(header.second, value))
        {
            return true;
        }
    }
    return false;
}

std::optional<std::string> ParsedRequest::header_value(const std::string& name) const
{
    for (const auto& header : headers)
    {
        if (boost::algorithm::iequals(header.first, name))
        {
            return header.second;
        }
    }
    return std::nullopt;
}

} // namespace ssdp
