#include "ssdp/message/utf8.hpp"

#include <cstdint>

namespace ssdp
{
namespace
{

constexpr const char* replacement_character = "\xEF\xBF\xBD";

bool in_range(std::uint8_t byte, std::uint8_t low, std::uint8_t high)
{
    return byte >= low && byte <= high;
}

} // namespace

std::string decode_utf8_lossy(const char* data, std::size_t size)
{
    std::string out;
    out.reserve(size);

    const auto* bytes = reinterpret_cast<const std::uint8_t*>(data);
    std::size_t pos   = 0;
    while (pos < size)
    {
        const std::uint8_t lead = bytes[pos];
        if (lead < 0x80)
        {
            out.push_back(static_cast<char>(lead));
            ++pos;
            continue;
        }

        std::size_t length = 0;
        // Allowed range of the first continuation byte
        std::uint8_t low  = 0x80;
        std::uint8_t high = 0xBF;
        if (in_range(lead, 0xC2, 0xDF))
        {
            length = 2;
        }
        else if (in_range(lead, 0xE0, 0xEF))
        {
            length = 3;
            if (lead == 0xE0)
            {
                low = 0xA0;
            }
            else if (lead == 0xED)
            {
                high = 0x9F;
            }
        }
        else if (in_range(lead, 0xF0, 0xF4))
        {
            length = 4;
            if (lead == 0xF0)
            {
                low = 0x90;
            }
            else if (lead == 0xF4)
            {
                high = 0x8F;
            }
        }

        if (length == 0)
        {
            out += replacement_character;
            ++pos;
            continue;
        }

        std::size_t valid = 1;
        while (valid < length && pos + valid < size)
        {
            const std::uint8_t byte = bytes[pos + valid];
            const bool ok           = valid == 1 ? in_range(byte, low, high) : in_range(byte, 0x80, 0xBF);
            if (!ok)
            {
                break;
            }
            ++valid;
        }

        if (valid == length)
        {
            out.append(data + pos, length);
        }
        else
        {
            out += replacement_character;
        }
        pos += valid;
    }

    return out;
}

} // namespace ssdp
