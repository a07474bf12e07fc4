#include "ssdp/net/ssdp_server.hpp"
#include "ssdp/logging/ssdp_logging.hpp"
#include "ssdp/message/request_kind.hpp"
#include "ssdp/message/ssdp_error.hpp"
#include "ssdp/net/udp_multicast_transport.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

#include <utility>

namespace ssdp
{
namespace
{

// Receive errors after which the socket is unusable
bool is_terminal_socket_error(const boost::system::error_code& error_code)
{
    return error_code == boost::asio::error::bad_descriptor || error_code == boost::asio::error::not_socket ||
           error_code == boost::asio::error::shut_down || error_code == boost::asio::error::network_down;
}

} // namespace

SsdpServer::SsdpServer(boost::asio::io_context& io_context, const ServerConfig& config)
    : SsdpServer(io_context, std::make_unique<UdpMulticastTransport>(io_context, config), config)
{
}

SsdpServer::SsdpServer(boost::asio::io_context& io_context, std::unique_ptr<DatagramTransport> transport, const ServerConfig& config)
    : _io_context(io_context), _config(config), _transport(std::move(transport)), _timer(io_context)
{
}

SsdpServer::~SsdpServer()
{
    stop();
}

ServerState SsdpServer::state() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _state;
}

boost::system::error_code SsdpServer::async_start()
{
    {
        std::unique_lock<std::mutex> lock(_mutex);
        if (_state != ServerState::stopped)
        {
            return error::already_started;
        }
        _state = ServerState::starting;

        boost::system::error_code error_code;
        _transport->open(error_code);
        if (error_code)
        {
            SSDP_LOG_ERROR("Failed to start: " << error_code.message());
            _state = ServerState::stopped;
            return error::bind_failed;
        }

        _state = ServerState::running;
        ++_pending_posts;
    }

    boost::asio::post(_io_context,
                      [this]()
                      {
                          std::unique_lock<std::mutex> lock(_mutex);
                          --_pending_posts;
                          if (_state == ServerState::running)
                          {
                              start_receive();
                              announce_all(NotifyKind::alive);
                              schedule_announce();
                          }
                          resolve_on_stopped();
                      });

    SSDP_LOG_INFO("SSDP server started with " << _registry.size() << " device(s)");
    return {};
}

bool SsdpServer::async_stop(std::function<void()> on_stopped)
{
    std::unique_lock<std::mutex> lock(_mutex);
    if (_state != ServerState::running)
    {
        return false;
    }

    _on_stopped = std::move(on_stopped);
    request_stop();
    return true;
}

void SsdpServer::stop()
{
    if (_io_context.get_executor().running_in_this_thread())
    {
        SSDP_LOG_WARNING("Stop called on io context. This isn't allowed!");
        return;
    }

    std::unique_lock<std::mutex> lock(_mutex);
    if (_state == ServerState::running)
    {
        request_stop();
    }
    _stopped_condition.wait(lock, [this]() { return _state == ServerState::stopped; });
}

void SsdpServer::set_stopped_callback(std::function<void()> callback)
{
    std::lock_guard<std::mutex> lock(_mutex);
    _stopped_callback = std::move(callback);
}

boost::system::error_code SsdpServer::add_device(const Device& device)
{
    std::unique_lock<std::mutex> lock(_mutex);
    if (_state == ServerState::stopping)
    {
        return error::server_stopping;
    }

    auto error_code = _registry.register_device(device);
    if (error_code || _state != ServerState::running)
    {
        return error_code;
    }

    ++_pending_posts;
    boost::asio::post(_io_context,
                      [this, usn = device.usn()]()
                      {
                          std::unique_lock<std::mutex> lock(_mutex);
                          --_pending_posts;
                          auto registered = _registry.find(usn);
                          if (_state == ServerState::running && registered)
                          {
                              send(make_notify(*registered, NotifyKind::alive, _transport->multicast_endpoint()));
                          }
                          resolve_on_stopped();
                      });
    return {};
}

bool SsdpServer::remove_device(const std::string& usn)
{
    std::unique_lock<std::mutex> lock(_mutex);
    auto removed = _registry.take(usn);
    if (!removed)
    {
        return false;
    }

    // Once begin_shutdown() ran the registry is empty, so a device found here got no byebye yet
    if (_state != ServerState::running && _state != ServerState::stopping)
    {
        return true;
    }

    ++_pending_posts;
    boost::asio::post(_io_context,
                      [this, device = std::move(*removed)]()
                      {
                          std::unique_lock<std::mutex> lock(_mutex);
                          --_pending_posts;
                          if (_transport->is_open())
                          {
                              send(make_notify(device, NotifyKind::byebye, _transport->multicast_endpoint()));
                          }
                          resolve_on_stopped();
                      });
    return true;
}

void SsdpServer::request_stop()
{
    _state = ServerState::stopping;
    ++_pending_posts;
    boost::asio::post(_io_context,
                      [this]()
                      {
                          std::unique_lock<std::mutex> lock(_mutex);
                          --_pending_posts;
                          begin_shutdown();
                      });
}

void SsdpServer::start_receive()
{
    _flags.set_flag(ServerOperation::receiving_async);
    _transport->async_receive([this](const boost::system::error_code& error_code, const RawMessage& message)
                              { handle_receive(error_code, message); });
}

void SsdpServer::handle_receive(const boost::system::error_code& error_code, const RawMessage& message)
{
    std::unique_lock<std::mutex> lock(_mutex);
    _flags.clear_flag(ServerOperation::receiving_async);

    if (error_code)
    {
        if (error_code == boost::asio::error::operation_aborted)
        {
            SSDP_LOG_INFO("SSDP server receive operation aborted.");
        }
        else if (is_terminal_socket_error(error_code))
        {
            SSDP_LOG_ERROR("Socket unusable, stopping: " << error_code.message());
            if (_state == ServerState::running)
            {
                _state = ServerState::stopping;
                begin_shutdown();
                return;
            }
        }
        else
        {
            SSDP_LOG_ERROR("UDP receive error: " << error_code.message());
        }
    }
    else
    {
        boost::system::error_code parse_error;
        auto request = message.parse(parse_error);
        if (request)
        {
            handle_request(*request);
        }
        else if (parse_error == error::incomplete)
        {
            SSDP_LOG_DEBUG("Dropping truncated datagram from " << message.remote_endpoint());
        }
        else
        {
            SSDP_LOG_DEBUG("Dropping malformed datagram from " << message.remote_endpoint() << ": " << parse_error.message());
        }
    }

    if (_state == ServerState::running)
    {
        start_receive();
        return;
    }
    resolve_on_stopped();
}

void SsdpServer::handle_request(const ParsedRequest& request)
{
    const RequestKind kind = classify(request);
    SSDP_LOG_TRACE(request.method << " from " << request.remote_endpoint << " classified as " << to_string(kind));

    switch (kind)
    {
    case RequestKind::search:
        handle_search(request);
        break;

    case RequestKind::alive:
        // Peers' announcements need no answer
        SSDP_LOG_DEBUG("Peer NOTIFY from " << request.remote_endpoint << " NT=" << request.header_value("NT").value_or(""));
        break;

    case RequestKind::unknown:
        break;
    }
}

void SsdpServer::handle_search(const ParsedRequest& request)
{
    auto search_target = request.header_value("ST");
    if (!search_target || search_target->empty())
    {
        SSDP_LOG_DEBUG("M-SEARCH without ST from " << request.remote_endpoint);
        return;
    }

    auto matches = _registry.find_matching(*search_target);
    SSDP_LOG_DEBUG("M-SEARCH for " << *search_target << " from " << request.remote_endpoint << ": " << matches.size() << " match(es)");
    for (const auto& device : matches)
    {
        send(make_search_response(device, request.remote_endpoint));
    }
}

void SsdpServer::schedule_announce()
{
    _flags.set_flag(ServerOperation::timer_running);
    _timer.expires_after(_config.announce_interval);
    _timer.async_wait([this](const boost::system::error_code& error_code) { handle_announce_timer(error_code); });
}

void SsdpServer::handle_announce_timer(const boost::system::error_code& error_code)
{
    std::unique_lock<std::mutex> lock(_mutex);
    _flags.clear_flag(ServerOperation::timer_running);

    if (error_code)
    {
        if (error_code == boost::asio::error::operation_aborted)
        {
            SSDP_LOG_DEBUG("Announce timer cancelled.");
        }
        else
        {
            SSDP_LOG_ERROR("Announce timer error: " << error_code.message());
        }
    }
    else if (_state == ServerState::running)
    {
        announce_all(NotifyKind::alive);
    }

    if (_state == ServerState::running)
    {
        schedule_announce();
        return;
    }
    resolve_on_stopped();
}

void SsdpServer::announce_all(NotifyKind kind)
{
    const auto group = _transport->multicast_endpoint();
    for (const auto& device : _registry.snapshot())
    {
        send(make_notify(device, kind, group));
    }
}

void SsdpServer::send(const Response& response)
{
    auto data = std::make_shared<const std::string>(response.encode());
    SSDP_LOG_TRACE("Sending to " << response.destination() << ":\n" << *data);

    ++_pending_sends;
    _transport->async_send_to(std::move(data), response.destination(),
                              [this](const boost::system::error_code& error_code, std::size_t bytes_transferred)
                              { handle_send(error_code, bytes_transferred); });
}

void SsdpServer::handle_send(const boost::system::error_code& error_code, std::size_t /*bytes_transferred*/)
{
    std::unique_lock<std::mutex> lock(_mutex);

    if (error_code)
    {
        if (error_code == boost::asio::error::operation_aborted)
        {
            SSDP_LOG_INFO("SSDP server send operation aborted.");
        }
        else
        {
            SSDP_LOG_ERROR("UDP send error: " << error_code.message());
        }
    }

    --_pending_sends;
    resolve_on_stopped();
}

void SsdpServer::begin_shutdown()
{
    if (_state != ServerState::stopping)
    {
        return;
    }

    // No alive may follow the byebye below
    _timer.cancel();

    const auto devices = _registry.snapshot();
    _registry.clear();
    if (_transport->is_open())
    {
        SSDP_LOG_INFO("Stopping, sending byebye for " << devices.size() << " device(s)");
        const auto group = _transport->multicast_endpoint();
        for (const auto& device : devices)
        {
            send(make_notify(device, NotifyKind::byebye, group));
        }
    }
    else
    {
        SSDP_LOG_WARNING("Stopping without byebye, the transport is closed");
    }

    if (_flags.get_flag(ServerOperation::receiving_async))
    {
        _transport->cancel();
    }
    resolve_on_stopped();
}

void SsdpServer::resolve_on_stopped()
{
    if (_state != ServerState::stopping)
    {
        return;
    }

    if (_flags.get_flag(ServerOperation::receiving_async) || _flags.get_flag(ServerOperation::timer_running) || _pending_sends != 0 ||
        _pending_posts != 0)
    {
        return;
    }

    _transport->close();
    _state = ServerState::stopped;
    SSDP_LOG_INFO("SSDP server stopped.");

    if (_on_stopped)
    {
        boost::asio::post(_io_context, std::move(_on_stopped));
        _on_stopped = nullptr;
    }
    if (_stopped_callback)
    {
        boost::asio::post(_io_context, _stopped_callback);
    }
    _stopped_condition.notify_all();
}

} // namespace ssdp
