#include "ssdp/logging/ssdp_logging.hpp"

namespace ssdp
{
namespace logging
{

LogLevel current_log_level = LogLevel::Info;

} // namespace logging
} // namespace ssdp
