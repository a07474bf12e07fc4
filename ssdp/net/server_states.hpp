#pragma once

namespace ssdp
{

enum class ServerState
{
    stopped,
    starting,
    running,
    stopping,
};

inline const char* to_string(ServerState state) noexcept
{
    switch (state)
    {
    case ServerState::stopped:
        return "stopped";

    case ServerState::starting:
        return "starting";

    case ServerState::running:
        return "running";

    case ServerState::stopping:
        return "stopping";
    }

    return "unknown";
}

/// Asynchronous operations the server may have outstanding.
enum class ServerOperation
{
    receiving_async,
    timer_running,
};

} // namespace ssdp
