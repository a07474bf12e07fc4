#pragma once

#include "ssdp/message/parsed_request.hpp"

namespace ssdp
{

/// What an incoming request asks of this device; decided once per request.
enum class RequestKind
{
    search,
    alive,
    unknown,
};

inline const char* to_string(RequestKind kind) noexcept
{
    switch (kind)
    {
    case RequestKind::search:
        return "search";

    case RequestKind::alive:
        return "alive";

    case RequestKind::unknown:
        return "unknown";
    }

    return "unknown";
}

/**
 * @brief Classify a parsed request.
 *
 * `M-SEARCH` carrying `MAN: "ssdp:discover"` is a search, any `NOTIFY` is a
 * peer announcement, everything else is unknown.
 */
RequestKind classify(const ParsedRequest& request);

} // namespace ssdp
