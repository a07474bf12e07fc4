#include "ssdp/message/request_kind.hpp"

namespace ssdp
{

RequestKind classify(const ParsedRequest& request)
{
    if (request.method == "M-SEARCH")
    {
        return request.header_contains("MAN", "\"ssdp:discover\"") ? RequestKind::search : RequestKind::unknown;
    }
    if (request.method == "NOTIFY")
    {
        return RequestKind::alive;
    }
    return RequestKind::unknown;
}

} // namespace ssdp
