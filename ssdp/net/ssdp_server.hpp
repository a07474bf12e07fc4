#pragma once

#include "ssdp/device/device_registry.hpp"
#include "ssdp/flags/flags.hpp"
#include "ssdp/message/parsed_request.hpp"
#include "ssdp/message/raw_message.hpp"
#include "ssdp/message/response.hpp"
#include "ssdp/net/datagram_transport.hpp"
#include "ssdp/net/server_config.hpp"
#include "ssdp/net/server_states.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace ssdp
{

/**
 * @brief Device side of SSDP.
 *
 * Answers M-SEARCH requests for registered devices, multicasts ssdp:alive on a
 * fixed interval and ssdp:byebye for every device when stopped. Receiving,
 * the announce timer and the stop request all complete on the io_context.
 */
class SsdpServer
{
public:
    /// Uses a UdpMulticastTransport built from `config`.
    SsdpServer(boost::asio::io_context& io_context, const ServerConfig& config = ServerConfig());
    SsdpServer(boost::asio::io_context& io_context, std::unique_ptr<DatagramTransport> transport, const ServerConfig& config = ServerConfig());
    ~SsdpServer();

    SsdpServer(const SsdpServer&)            = delete;
    SsdpServer& operator=(const SsdpServer&) = delete;
    SsdpServer(SsdpServer&&)                 = delete;
    SsdpServer& operator=(SsdpServer&&)      = delete;

    /**
     * @brief Open the transport and start receiving and announcing.
     * @return error::already_started unless stopped, error::bind_failed if the socket could not
     *         be bound or the group joined. The server is stopped again after a failure.
     */
    boost::system::error_code async_start();

    /**
     * @brief Send byebye for every device, then release the transport.
     * @param on_stopped Posted to the io_context once everything is done.
     * @return false if the server is not running.
     */
    bool async_stop(std::function<void()> on_stopped);

    /**
     * @brief Stop and wait until the server is stopped, including a stop already in progress.
     *
     * Must not be called on the io_context thread, and another thread has to run the io_context.
     */
    void stop();

    /**
     * @brief Posted to the io_context every time the server reaches stopped.
     *
     * Also covers stops the server makes on its own after the socket became unusable.
     */
    void set_stopped_callback(std::function<void()> callback);

    /**
     * @brief Register a device; it is announced right away when the server runs.
     * @return error::server_stopping while a stop is in progress, else as DeviceRegistry::register_device().
     */
    boost::system::error_code add_device(const Device& device);

    /// Deregister a device; a byebye is sent for it when the server runs.
    bool remove_device(const std::string& usn);

    const DeviceRegistry& registry() const { return _registry; }

    ServerState state() const;

private:
    mutable std::mutex _mutex;

    // Called with _mutex held
    void request_stop();

    // Called on the io_context thread with _mutex held

    void start_receive();
    void handle_receive(const boost::system::error_code& error_code, const RawMessage& message);
    void handle_request(const ParsedRequest& request);
    void handle_search(const ParsedRequest& request);
    void schedule_announce();
    void handle_announce_timer(const boost::system::error_code& error_code);
    void announce_all(NotifyKind kind);
    void send(const Response& response);
    void handle_send(const boost::system::error_code& error_code, std::size_t bytes_transferred);
    void begin_shutdown();
    void resolve_on_stopped();

    boost::asio::io_context& _io_context;
    ServerConfig _config;
    std::unique_ptr<DatagramTransport> _transport;
    boost::asio::steady_timer _timer;
    DeviceRegistry _registry;

    ServerState _state = ServerState::stopped;
    Flags<ServerOperation> _flags;
    std::size_t _pending_sends = 0;
    std::size_t _pending_posts = 0;
    std::function<void()> _on_stopped;
    std::function<void()> _stopped_callback;
    std::condition_variable _stopped_condition;
};

} // namespace ssdp
