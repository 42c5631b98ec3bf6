#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include "tether/networking/connection.hpp"
#include "tether/networking/transport.hpp"

namespace tether::test_support {

// Runs an io_context on a background thread for the lifetime of a test.
class IoThread {
public:
    IoThread() : work_(io_.get_executor()), thread_([this] { io_.run(); }) {}

    ~IoThread() { stop(); }

    // Joins the thread; nothing runs on the io_context afterwards.
    void stop() {
        if (!thread_.joinable()) {
            return;
        }
        work_.reset();
        io_.stop();
        thread_.join();
    }

    boost::asio::io_context& io() { return io_; }

private:
    boost::asio::io_context io_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    std::thread thread_;
};

// Records connection lifecycle callbacks for assertions from the test thread.
struct Events {
    std::mutex mutex;
    std::condition_variable cv;
    int connected = 0;
    int closed = 0;
    std::vector<ErrorKind> errors;

    networking::ConnectionCallbacks callbacks() {
        networking::ConnectionCallbacks cb;
        cb.on_connected = [this](const networking::Negotiated&) {
            std::lock_guard<std::mutex> lock(mutex);
            ++connected;
            cv.notify_all();
        };
        cb.on_disconnected = [this](const Error& error) {
            std::lock_guard<std::mutex> lock(mutex);
            errors.push_back(error.kind());
            cv.notify_all();
        };
        cb.on_closed = [this] {
            std::lock_guard<std::mutex> lock(mutex);
            ++closed;
            cv.notify_all();
        };
        return cb;
    }

    template <typename Predicate>
    bool wait(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, [&] { return predicate(*this); });
    }

    bool saw(ErrorKind kind) {
        std::lock_guard<std::mutex> lock(mutex);
        for (ErrorKind k : errors) {
            if (k == kind) {
                return true;
            }
        }
        return false;
    }
};

// Polls predicate until it holds or the timeout passes.
template <typename Predicate>
bool eventually(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

// Connected pair of in-process stream sockets, each on its own strand.
inline std::pair<std::unique_ptr<networking::Transport>, std::unique_ptr<networking::Transport>>
local_transport_pair(boost::asio::io_context& io) {
    boost::asio::local::stream_protocol::socket a(boost::asio::make_strand(io));
    boost::asio::local::stream_protocol::socket b(boost::asio::make_strand(io));
    boost::asio::local::connect_pair(a, b);
    return {std::make_unique<networking::LocalTransport>(std::move(a)),
            std::make_unique<networking::LocalTransport>(std::move(b))};
}

inline ConnectionConfig test_config() {
    ConnectionConfig config;
    config.heartbeat_interval = std::chrono::milliseconds(5000);
    config.peer_timeout = std::chrono::milliseconds(0);
    config.handshake_timeout = std::chrono::milliseconds(2000);
    config.drain_timeout = std::chrono::milliseconds(2000);
    config.sweep_interval = std::chrono::milliseconds(10);
    return config;
}

inline std::vector<uint8_t> bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

inline std::string text(const std::vector<uint8_t>& data) {
    return std::string(data.begin(), data.end());
}

} // namespace tether::test_support
