#pragma once

#include <cstddef>
#include <string>

namespace ssdp
{

/**
 * @brief Decode bytes as UTF-8, replacing every invalid sequence with U+FFFD.
 *
 * Each maximal invalid subpart becomes one replacement character, so the
 * result is always valid UTF-8 and decoding never fails.
 */
std::string decode_utf8_lossy(const char* data, std::size_t size);

} // namespace ssdp
