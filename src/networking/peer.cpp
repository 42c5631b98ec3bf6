#include "tether/networking/peer.hpp"
#include "tether/log.hpp"

namespace tether::networking {

using boost::asio::ip::tcp;

// --- Client ---

std::shared_ptr<Client> Client::create(boost::asio::io_context& io, TransportFactory connect,
                                       ConnectionConfig config, ReconnectPolicy policy, ClientCallbacks callbacks) {
    return std::shared_ptr<Client>(
        new Client(io, std::move(connect), std::move(config), std::move(policy), std::move(callbacks)));
}

Client::Client(boost::asio::io_context& io, TransportFactory connect, ConnectionConfig config, ReconnectPolicy policy,
               ClientCallbacks callbacks)
    : io_(io),
      strand_(boost::asio::make_strand(io)),
      connect_(std::move(connect)),
      config_(std::move(config)),
      policy_(std::move(policy)),
      callbacks_(std::move(callbacks)),
      retry_timer_(strand_) {}

void Client::on_inbound_command(CommandHandler handler) {
    command_handler_ = std::move(handler);
}

void Client::start() {
    auto self = shared_from_this();
    boost::asio::post(strand_, [self] { self->connect(); });
}

void Client::stop() {
    stopping_ = true;
    auto self = shared_from_this();
    boost::asio::post(strand_, [self] {
        self->retry_timer_.cancel();
        if (auto connection = self->connection()) {
            connection->shutdown();
        }
    });
}

std::shared_ptr<Connection> Client::connection() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connection_;
}

void Client::connect() {
    if (stopping_) {
        return;
    }
    auto self = shared_from_this();
    connect_(io_, [self](const boost::system::error_code& ec, std::unique_ptr<Transport> transport) {
        auto holder = std::make_shared<std::unique_ptr<Transport>>(std::move(transport));
        boost::asio::post(self->strand_, [self, ec, holder] { self->on_transport(ec, std::move(*holder)); });
    });
}

void Client::on_transport(const boost::system::error_code& ec, std::unique_ptr<Transport> transport) {
    if (stopping_) {
        if (transport) {
            transport->close();
        }
        return;
    }
    if (ec) {
        log::warn("client", "connect failed: " + ec.message());
        schedule_retry(ec.message());
        return;
    }

    std::weak_ptr<Client> weak = shared_from_this();
    auto last_error = std::make_shared<std::optional<Error>>();

    ConnectionCallbacks callbacks;
    callbacks.on_connected = [weak](const Negotiated&) {
        auto self = weak.lock();
        if (!self) {
            return;
        }
        self->attempt_ = 0;
        auto connection = self->connection();
        if (connection && self->callbacks_.on_connected) {
            self->callbacks_.on_connected(connection);
        }
    };
    callbacks.on_disconnected = [weak, last_error](const Error& error) {
        *last_error = error;
        auto self = weak.lock();
        if (self && self->callbacks_.on_disconnected) {
            self->callbacks_.on_disconnected(error);
        }
    };
    callbacks.on_closed = [weak, last_error] {
        if (auto self = weak.lock()) {
            boost::asio::post(self->strand_, [self, last_error] { self->on_connection_closed(*last_error); });
        }
    };

    auto connection = Connection::create(std::move(transport), Role::Initiator, config_, std::move(callbacks));
    if (command_handler_) {
        connection->on_inbound_command(command_handler_);
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_ = connection;
    }
    connection->start();
}

void Client::on_connection_closed(std::optional<Error> error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_.reset();
    }
    if (callbacks_.on_closed) {
        callbacks_.on_closed();
    }
    if (stopping_ || !error) {
        log::info("client", "connection closed");
        return;
    }
    if (error->kind() == ErrorKind::UnsupportedVersion) {
        give_up(*error);
        return;
    }
    schedule_retry(error->what());
}

void Client::schedule_retry(const std::string& reason) {
    if (stopping_) {
        return;
    }
    if (!policy_.enabled) {
        give_up(Error(ErrorKind::ConnectionLost, "reconnect disabled: " + reason));
        return;
    }
    if (attempt_ >= policy_.max_attempts) {
        give_up(Error(ErrorKind::ConnectionLost,
                      "giving up after " + std::to_string(policy_.max_attempts) + " reconnect attempts: " + reason));
        return;
    }

    const uint32_t attempt = ++attempt_;
    const auto delay = policy_.delay_for(attempt);
    log::warn("client", "reconnect attempt " + std::to_string(attempt) + "/" + std::to_string(policy_.max_attempts) +
                        " in " + std::to_string(delay.count()) + "ms");
    if (callbacks_.on_reconnect_attempt) {
        callbacks_.on_reconnect_attempt(attempt, delay);
    }

    auto self = shared_from_this();
    retry_timer_.expires_after(delay);
    retry_timer_.async_wait([self](const boost::system::error_code& ec) {
        if (!ec) {
            self->connect();
        }
    });
}

void Client::give_up(const Error& error) {
    if (gave_up_) {
        return;
    }
    gave_up_ = true;
    stopping_ = true;
    log::error("client", error.what());
    if (callbacks_.on_error) {
        callbacks_.on_error(error);
    }
}

// --- Server ---

std::shared_ptr<Server> Server::create(boost::asio::io_context& io, const tcp::endpoint& endpoint,
                                       ConnectionConfig config, CommandHandler handler, ServerCallbacks callbacks) {
    return std::shared_ptr<Server>(
        new Server(io, endpoint, std::move(config), std::move(handler), std::move(callbacks)));
}

Server::Server(boost::asio::io_context& io, const tcp::endpoint& endpoint, ConnectionConfig config,
               CommandHandler handler, ServerCallbacks callbacks)
    : io_(io),
      acceptor_(io),
      config_(std::move(config)),
      handler_(std::move(handler)),
      callbacks_(std::move(callbacks)) {
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
}

void Server::start() {
    log::info("server", "listening on port " + std::to_string(port()));
    accept();
}

void Server::stop() {
    stopping_ = true;
    auto self = shared_from_this();
    boost::asio::post(acceptor_.get_executor(), [self] {
        boost::system::error_code ec;
        self->acceptor_.close(ec);
    });

    std::set<std::shared_ptr<Connection>> live;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        live = connections_;
    }
    for (auto& connection : live) {
        connection->shutdown();
    }
}

uint16_t Server::port() const {
    return acceptor_.local_endpoint().port();
}

std::size_t Server::connection_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

void Server::accept() {
    auto self = shared_from_this();
    auto socket = std::make_shared<tcp::socket>(boost::asio::make_strand(io_));
    acceptor_.async_accept(*socket, [self, socket](const boost::system::error_code& ec) {
        self->on_accept(ec, std::move(*socket));
    });
}

void Server::on_accept(const boost::system::error_code& ec, tcp::socket socket) {
    if (ec) {
        if (ec == boost::asio::error::operation_aborted || stopping_) {
            return;
        }
        log::warn("server", "accept failed: " + ec.message());
        if (callbacks_.on_error) {
            callbacks_.on_error(Error(ErrorKind::ConnectionLost, "accept failed: " + ec.message()));
        }
        accept();
        return;
    }
    if (stopping_) {
        return;
    }

    std::weak_ptr<Server> weak = shared_from_this();
    auto peer = std::make_shared<std::weak_ptr<Connection>>();

    ConnectionCallbacks callbacks;
    callbacks.on_connected = [weak, peer](const Negotiated&) {
        auto self = weak.lock();
        auto connection = peer->lock();
        if (self && connection && self->callbacks_.on_connection) {
            self->callbacks_.on_connection(connection);
        }
    };
    callbacks.on_disconnected = [weak, peer](const Error& error) {
        auto self = weak.lock();
        auto connection = peer->lock();
        if (self && connection && self->callbacks_.on_disconnected) {
            self->callbacks_.on_disconnected(connection, error);
        }
    };
    callbacks.on_closed = [weak, peer] {
        auto self = weak.lock();
        auto connection = peer->lock();
        if (self && connection) {
            std::lock_guard<std::mutex> lock(self->mutex_);
            self->connections_.erase(connection);
        }
    };

    auto connection = Connection::create(make_tcp_transport(std::move(socket)), Role::Acceptor, config_,
                                         std::move(callbacks));
    *peer = connection;
    connection->on_inbound_command(handler_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connections_.insert(connection);
    }
    log::info("server", "accepted " + connection->remote_endpoint());
    connection->start();
    accept();
}

} // namespace tether::networking
