#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>
#include "tether/error.hpp"
#include "tether/protocol/packet.hpp"

namespace tether::networking {

using Clock = std::chrono::steady_clock;

// Receives intermediate (streaming) responses for one request, on the
// connection's io thread. An exception thrown here fails that request.
using FragmentCallback = std::function<void(const protocol::Packet& fragment)>;

struct RequestOptions {
    // Unset: the connection's request_timeout. Zero: no deadline.
    std::optional<std::chrono::milliseconds> timeout;
    FragmentCallback on_fragment;
    // Allow zlib on this command's payload when it is large enough.
    bool compress = true;
};

// Resolves with the terminal response, or with tether::Error
// (Timeout, Cancelled, ConnectionLost, ...).
struct RequestHandle {
    uint64_t correlation_id = 0;
    std::future<protocol::Packet> result;
};

// Correlation-id bookkeeping for commands awaiting responses.
//
// Thread-safe: submit/cancel are called by application threads while
// responses arrive on the io thread. The table lock is never held while
// sending or while resolving a waiter. Outgoing commands leave through the
// SendFn sink, so the multiplexer knows nothing about the connection.
class Multiplexer {
public:
    using SendFn = std::function<void(uint64_t correlation_id, std::vector<uint8_t> payload, bool compress)>;
    using LatencyFn = std::function<void(Clock::duration)>;

    explicit Multiplexer(SendFn send, std::chrono::milliseconds default_timeout = std::chrono::milliseconds(0),
                         uint64_t first_id = 1);

    // Registers a waiter, then sends. Throws the closing error once
    // fail_all() has run.
    RequestHandle submit(std::vector<uint8_t> payload, const RequestOptions& options = {},
                         Clock::time_point now = Clock::now());

    // Routes one inbound response. Returns false for a stray id (no pending
    // request), which is logged and dropped.
    bool on_response(protocol::Packet&& response);

    // Resolves the waiter with Cancelled. False if the id is not pending.
    bool cancel(uint64_t correlation_id);

    // Resolves every request whose deadline is at or before now with Timeout.
    std::size_t expire_overdue(Clock::time_point now);

    // Resolves every pending request with error; later submits throw it.
    void fail_all(const Error& error);

    std::size_t pending_count() const;
    bool is_pending(uint64_t correlation_id) const;

    void set_latency_observer(LatencyFn observer);

private:
    struct PendingRequest {
        std::promise<protocol::Packet> promise;
        Clock::time_point submitted_at;
        std::optional<Clock::time_point> deadline;
        std::shared_ptr<FragmentCallback> on_fragment;
    };

    uint64_t allocate_id();
    void fail_request(uint64_t correlation_id, std::exception_ptr error);

    SendFn send_;
    std::chrono::milliseconds default_timeout_;
    LatencyFn latency_observer_;

    mutable std::mutex mutex_;
    std::unordered_map<uint64_t, PendingRequest> pending_;
    uint64_t next_id_;
    std::optional<Error> closed_;
};

} // namespace tether::networking
