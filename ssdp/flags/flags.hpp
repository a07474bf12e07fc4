#pragma once

#include <cstdint>
#include <type_traits>

namespace ssdp
{

/**
 * @brief Bit set indexed by an enum.
 *
 * Not synchronized; owners guard it with their own mutex.
 */
template <typename FlagType>
class Flags
{
    static_assert(std::is_enum<FlagType>::value, "FlagType must be an enum");

public:
    Flags() = default;

    void set_flag(FlagType flag) { _flags |= bit(flag); }

    void clear_flag(FlagType flag) { _flags &= ~bit(flag); }

    bool get_flag(FlagType flag) const { return (_flags & bit(flag)) != 0; }

private:
    static std::uint32_t bit(FlagType flag) { return 1U << static_cast<std::uint32_t>(flag); }

    std::uint32_t _flags = 0;
};
} // namespace ssdp
