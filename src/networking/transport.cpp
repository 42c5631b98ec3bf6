#include "tether/networking/transport.hpp"
#include "tether/log.hpp"

namespace tether::networking {

using boost::asio::ip::tcp;

namespace {

// Shared by the resolver, connect and timer handlers of one attempt.
struct ConnectAttempt {
    ConnectAttempt(boost::asio::io_context& io, ConnectHandler h)
        : strand(boost::asio::make_strand(io)),
          resolver(strand),
          socket(strand),
          timer(strand),
          handler(std::move(h)) {}

    void complete(const boost::system::error_code& ec) {
        if (done) {
            return;
        }
        done = true;
        timer.cancel();
        if (ec) {
            boost::system::error_code ignored;
            socket.close(ignored);
            handler(ec, nullptr);
            return;
        }
        handler(ec, make_tcp_transport(std::move(socket)));
    }

    boost::asio::strand<boost::asio::io_context::executor_type> strand;
    tcp::resolver resolver;
    tcp::socket socket;
    boost::asio::steady_timer timer;
    ConnectHandler handler;
    bool done = false;
};

} // namespace

std::unique_ptr<Transport> make_tcp_transport(tcp::socket socket) {
    boost::system::error_code ec;
    socket.set_option(tcp::no_delay(true), ec);
    if (ec) {
        log::warn("transport", "could not disable Nagle: " + ec.message());
    }
    return std::make_unique<TcpTransport>(std::move(socket));
}

TransportFactory tcp_connector(std::string host, uint16_t port, std::chrono::milliseconds timeout) {
    return [host, port, timeout](boost::asio::io_context& io, ConnectHandler handler) {
        auto attempt = std::make_shared<ConnectAttempt>(io, std::move(handler));

        attempt->timer.expires_after(timeout);
        attempt->timer.async_wait([attempt](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted || attempt->done) {
                return;
            }
            attempt->resolver.cancel();
            attempt->complete(boost::asio::error::timed_out);
        });

        attempt->resolver.async_resolve(host, std::to_string(port),
            [attempt](const boost::system::error_code& ec, tcp::resolver::results_type results) {
                if (ec) {
                    attempt->complete(ec);
                    return;
                }
                boost::asio::async_connect(attempt->socket, results,
                    [attempt](const boost::system::error_code& ec, const tcp::endpoint&) {
                        attempt->complete(ec);
                    });
            });
    };
}

} // namespace tether::networking
