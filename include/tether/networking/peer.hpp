#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <boost/asio.hpp>
#include "tether/config.hpp"
#include "tether/error.hpp"
#include "tether/networking/connection.hpp"
#include "tether/networking/transport.hpp"

namespace tether::networking {

struct ClientCallbacks {
    std::function<void(std::shared_ptr<Connection>)> on_connected;
    std::function<void(const Error&)> on_disconnected;
    // attempt counts from 1; delay is the backoff before that attempt.
    std::function<void(uint32_t attempt, std::chrono::milliseconds delay)> on_reconnect_attempt;
    std::function<void()> on_closed;
    // Fatal: retries exhausted (ConnectionLost) or UnsupportedVersion.
    std::function<void(const Error&)> on_error;
};

// Initiating side. Keeps one Connection up under the reconnect policy.
class Client : public std::enable_shared_from_this<Client> {
public:
    static std::shared_ptr<Client> create(boost::asio::io_context& io, TransportFactory connect,
                                          ConnectionConfig config, ReconnectPolicy policy,
                                          ClientCallbacks callbacks = {});

    // Handler for commands the target sends back (rare). Call before start().
    void on_inbound_command(CommandHandler handler);

    void start();

    // Graceful: the live connection drains; no further reconnects.
    void stop();

    std::shared_ptr<Connection> connection() const;
    uint32_t attempts() const { return attempt_; }

private:
    Client(boost::asio::io_context& io, TransportFactory connect, ConnectionConfig config, ReconnectPolicy policy,
           ClientCallbacks callbacks);

    void connect();
    void on_transport(const boost::system::error_code& ec, std::unique_ptr<Transport> transport);
    void on_connection_closed(std::optional<Error> error);
    void schedule_retry(const std::string& reason);
    void give_up(const Error& error);

    boost::asio::io_context& io_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    TransportFactory connect_;
    const ConnectionConfig config_;
    const ReconnectPolicy policy_;
    const ClientCallbacks callbacks_;
    CommandHandler command_handler_;

    boost::asio::steady_timer retry_timer_;
    std::atomic<uint32_t> attempt_{0};
    std::atomic<bool> stopping_{false};
    bool gave_up_ = false;

    mutable std::mutex mutex_;
    std::shared_ptr<Connection> connection_;
};

struct ServerCallbacks {
    // After the handshake of each accepted peer.
    std::function<void(std::shared_ptr<Connection>)> on_connection;
    std::function<void(std::shared_ptr<Connection>, const Error&)> on_disconnected;
    std::function<void(const Error&)> on_error;
};

// Target side: accepts TCP peers, one Connection each, all sharing the
// same command handler.
class Server : public std::enable_shared_from_this<Server> {
public:
    static std::shared_ptr<Server> create(boost::asio::io_context& io, const boost::asio::ip::tcp::endpoint& endpoint,
                                          ConnectionConfig config, CommandHandler handler,
                                          ServerCallbacks callbacks = {});

    void start();

    // Stops accepting and shuts every live connection down gracefully.
    void stop();

    uint16_t port() const;
    std::size_t connection_count() const;

private:
    Server(boost::asio::io_context& io, const boost::asio::ip::tcp::endpoint& endpoint, ConnectionConfig config,
           CommandHandler handler, ServerCallbacks callbacks);

    void accept();
    void on_accept(const boost::system::error_code& ec, boost::asio::ip::tcp::socket socket);

    boost::asio::io_context& io_;
    boost::asio::ip::tcp::acceptor acceptor_;
    const ConnectionConfig config_;
    const CommandHandler handler_;
    const ServerCallbacks callbacks_;
    std::atomic<bool> stopping_{false};

    mutable std::mutex mutex_;
    std::set<std::shared_ptr<Connection>> connections_;
};

} // namespace tether::networking
