#pragma once

#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <sstream>
#include <string>

namespace tether::networking {

using IoHandler = std::function<void(const boost::system::error_code&, std::size_t)>;

// Ordered byte stream under a Connection.
//
// Completion handlers run on get_executor(). When the io_context is run by
// several threads that executor must be a strand (see make_strand), since
// the connection relies on it for single-writer access to its state.
class Transport {
public:
    virtual ~Transport() = default;

    virtual boost::asio::any_io_executor get_executor() = 0;

    virtual void async_read_some(boost::asio::mutable_buffer buffer, IoHandler handler) = 0;

    // Completes after the whole buffer is written or on the first error.
    virtual void async_write(boost::asio::const_buffer buffer, IoHandler handler) = 0;

    virtual void close() = 0;

    virtual std::string remote_endpoint() const = 0;
};

template <typename Socket>
class SocketTransport : public Transport {
public:
    explicit SocketTransport(Socket socket) : socket_(std::move(socket)) {}

    boost::asio::any_io_executor get_executor() override { return socket_.get_executor(); }

    void async_read_some(boost::asio::mutable_buffer buffer, IoHandler handler) override {
        socket_.async_read_some(buffer, std::move(handler));
    }

    void async_write(boost::asio::const_buffer buffer, IoHandler handler) override {
        boost::asio::async_write(socket_, buffer, std::move(handler));
    }

    void close() override {
        boost::system::error_code ec;
        socket_.shutdown(Socket::shutdown_both, ec);
        socket_.close(ec);
    }

    std::string remote_endpoint() const override {
        boost::system::error_code ec;
        auto endpoint = socket_.remote_endpoint(ec);
        if (ec) {
            return "<unconnected>";
        }
        std::ostringstream out;
        out << endpoint;
        return out.str();
    }

    Socket& socket() { return socket_; }

private:
    Socket socket_;
};

using TcpTransport = SocketTransport<boost::asio::ip::tcp::socket>;
using LocalTransport = SocketTransport<boost::asio::local::stream_protocol::socket>;

// Disables Nagle on an accepted or connected TCP socket and wraps it.
std::unique_ptr<Transport> make_tcp_transport(boost::asio::ip::tcp::socket socket);

using ConnectHandler = std::function<void(const boost::system::error_code&, std::unique_ptr<Transport>)>;

// Opens a new transport; used by Client for the first connection and for
// every reconnect attempt.
using TransportFactory = std::function<void(boost::asio::io_context&, ConnectHandler)>;

// Resolves host:port and connects over TCP on a fresh strand. Fails with
// boost::asio::error::timed_out when the attempt exceeds timeout.
TransportFactory tcp_connector(std::string host, uint16_t port, std::chrono::milliseconds timeout);

} // namespace tether::networking
