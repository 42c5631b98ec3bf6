#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <boost/asio.hpp>
#include "tether/config.hpp"
#include "tether/error.hpp"
#include "tether/networking/multiplexer.hpp"
#include "tether/networking/transport.hpp"
#include "tether/protocol/codec.hpp"
#include "tether/protocol/hello.hpp"
#include "tether/protocol/packet.hpp"
#include "tether/transfer/bandwidth.hpp"

namespace tether::networking {

enum class ConnectionState {
    Handshaking,
    Active,
    Draining,
    Closed
};

const char* to_string(ConnectionState state);

enum class Role {
    Initiator,
    Acceptor
};

// Outcome of the handshake.
struct Negotiated {
    uint32_t version = 0;
    protocol::Capabilities capabilities;
    std::string peer_id;
};

class Connection;

// Answers one inbound command. Handed to the command handler; may be kept
// and used from any thread after the handler returns. Exactly one terminal
// response is sent: later calls to finish()/fail() are ignored.
class Responder {
public:
    Responder(std::weak_ptr<Connection> connection, uint64_t correlation_id);

    uint64_t correlation_id() const { return correlation_id_; }

    // Intermediate response (streaming flag, no last-chunk marker). Blocks
    // while the connection holds write_high_water bytes or more that are
    // not yet written, unless called from the connection's own command
    // handler. Returns without sending once cancelled.
    void send_fragment(std::vector<uint8_t> payload, protocol::Flags extra = protocol::flags::kNone);

    // Terminal response. Carries streaming|last_chunk when fragments preceded it.
    void finish(std::vector<uint8_t> payload = {}, protocol::Flags extra = protocol::flags::kNone);

    // Terminal response flagged as an error; the payload is the message.
    void fail(const std::string& message);

    // Set when the peer sent Cancel for this id or the connection closed.
    // Further output is discarded.
    bool cancelled() const { return cancelled_; }
    bool finished() const { return finished_; }

    // What the handshake agreed on; empty once the connection is gone.
    std::optional<protocol::Capabilities> capabilities() const;

private:
    friend class Connection;

    void mark_cancelled() { cancelled_ = true; }

    std::weak_ptr<Connection> connection_;
    uint64_t correlation_id_;
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> finished_{false};
    std::atomic<bool> streamed_{false};
};

// Invoked on the io thread for every inbound command. Must return quickly;
// long work belongs on another executor, answering through the responder.
using CommandHandler = std::function<void(const protocol::Packet& command, std::shared_ptr<Responder> responder)>;

struct ConnectionCallbacks {
    std::function<void(const Negotiated&)> on_connected;
    // Abnormal teardown only; a drained close after Goodbye does not call it.
    std::function<void(const Error&)> on_disconnected;
    // Always called once, after on_disconnected when both fire.
    std::function<void()> on_closed;
};

// One physical stream: handshake, heartbeat, dispatch, draining, teardown.
//
// All state is mutated on the transport's executor. submit(), cancel(),
// shutdown(), abort() and the Responder API are safe from any thread.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    static std::shared_ptr<Connection> create(std::unique_ptr<Transport> transport, Role role,
                                              ConnectionConfig config, ConnectionCallbacks callbacks = {});

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Call before start().
    void on_inbound_command(CommandHandler handler);

    // Starts reading; the initiator also sends its Hello.
    void start();

    // Sends a command. Throws tether::Error(ConnectionLost) unless Active.
    RequestHandle submit(std::vector<uint8_t> payload, RequestOptions options = {});

    // Local cancellation; notify_peer also sends a best-effort Cancel.
    bool cancel(uint64_t correlation_id, bool notify_peer = false);

    // Graceful close: Goodbye, then Draining until nothing is in flight.
    void shutdown();

    void abort(const Error& error);

    ConnectionState state() const { return state_; }
    Role role() const { return role_; }
    std::optional<Negotiated> negotiated() const;
    const std::string& client_id() const { return client_id_; }
    std::string remote_endpoint() const { return transport_->remote_endpoint(); }
    std::size_t pending_requests() const { return mux_.pending_count(); }
    // Bytes queued for the stream and not yet written.
    std::size_t write_backlog() const;
    uint64_t heartbeats_sent() const { return heartbeats_sent_; }
    uint64_t heartbeats_received() const { return heartbeats_received_; }

    // Bytes written and request round-trip times.
    const transfer::BandwidthEstimator& link_stats() const { return link_stats_; }

private:
    friend class Responder;

    using Frame = std::shared_ptr<const std::vector<uint8_t>>;

    Connection(std::unique_ptr<Transport> transport, Role role, ConnectionConfig config,
               ConnectionCallbacks callbacks);

    Frame encode_frame(protocol::MessageKind kind, uint64_t correlation_id, std::vector<uint8_t> payload,
                       protocol::Flags packet_flags, bool allow_compress) const;
    protocol::Packet inflate(protocol::Packet&& packet) const;

    void send_command(uint64_t correlation_id, std::vector<uint8_t> payload, bool compress);
    void send_response(uint64_t correlation_id, std::vector<uint8_t> payload, protocol::Flags packet_flags,
                       bool terminal);

    protocol::Hello local_hello() const;
    void handle_packet(const protocol::PacketView& view);
    void handle_hello(const protocol::Hello& hello);
    void handle_command(protocol::Packet&& command);
    void handle_cancel(uint64_t correlation_id);
    void activate(uint32_t version, const protocol::Hello& peer);

    void read_more();
    void on_read(const boost::system::error_code& ec, std::size_t size);
    void enqueue(Frame frame, bool accounted = false);
    void write_next();
    void on_write(const boost::system::error_code& ec, std::size_t size);
    void add_backlog(std::size_t bytes);
    void release_backlog(std::size_t bytes);
    void wake_writers();
    void wait_for_room(const Responder& responder);

    void arm_handshake_timer();
    void schedule_heartbeat();
    void schedule_liveness();
    void schedule_sweep();

    void begin_draining(bool local);
    bool drained() const;
    void maybe_finish_drain();
    // flush lets queued frames reach the peer first, bounded by drain_timeout.
    void teardown(const Error& error, bool flush = false);
    void cancel_timers();
    void close_transport(bool flush);

    std::unique_ptr<Transport> transport_;
    boost::asio::any_io_executor executor_;
    const Role role_;
    const ConnectionConfig config_;
    const ConnectionCallbacks callbacks_;
    std::string client_id_;
    CommandHandler command_handler_;

    std::atomic<ConnectionState> state_{ConnectionState::Handshaking};
    std::atomic<uint32_t> version_;
    std::atomic<bool> compression_enabled_{false};
    std::atomic<std::size_t> max_outbound_payload_;
    mutable std::mutex negotiated_mutex_;
    std::optional<Negotiated> negotiated_;

    protocol::FrameCodec codec_;
    Multiplexer mux_;
    std::unordered_map<uint64_t, std::shared_ptr<Responder>> inbound_;

    std::deque<Frame> write_queue_;
    bool writing_ = false;
    bool close_when_flushed_ = false;
    Frame heartbeat_frame_;
    mutable std::mutex backlog_mutex_;
    std::condition_variable backlog_cv_;
    std::size_t backlog_bytes_ = 0;

    Clock::time_point last_send_;
    Clock::time_point last_receive_;
    std::atomic<uint64_t> heartbeats_sent_{0};
    std::atomic<uint64_t> heartbeats_received_{0};
    transfer::BandwidthEstimator link_stats_;

    boost::asio::steady_timer handshake_timer_;
    boost::asio::steady_timer heartbeat_timer_;
    boost::asio::steady_timer liveness_timer_;
    boost::asio::steady_timer sweep_timer_;
    boost::asio::steady_timer drain_timer_;
};

} // namespace tether::networking
