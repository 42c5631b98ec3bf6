#include "tether/networking/connection.hpp"
#include "tether/compression.hpp"
#include "tether/log.hpp"
#include "tether/security.hpp"
#include <algorithm>
#include <chrono>

namespace tether::networking {

using protocol::MessageKind;
namespace flags = protocol::flags;

namespace {

constexpr std::size_t kReadSize = 64 * 1024;
const char* kComponent = "connection";

uint64_t now_ms() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

std::string ms(std::chrono::milliseconds d) {
    return std::to_string(d.count()) + "ms";
}

// Set while a connection runs its command handler on this thread.
thread_local const Connection* dispatching = nullptr;

struct DispatchScope {
    explicit DispatchScope(const Connection* connection) : previous(dispatching) { dispatching = connection; }
    ~DispatchScope() { dispatching = previous; }
    const Connection* previous;
};

} // namespace

const char* to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Handshaking: return "Handshaking";
        case ConnectionState::Active:      return "Active";
        case ConnectionState::Draining:    return "Draining";
        case ConnectionState::Closed:      return "Closed";
    }
    return "Unknown";
}

// --- Responder ---

Responder::Responder(std::weak_ptr<Connection> connection, uint64_t correlation_id)
    : connection_(std::move(connection)), correlation_id_(correlation_id) {}

void Responder::send_fragment(std::vector<uint8_t> payload, protocol::Flags extra) {
    if (finished_ || cancelled_) {
        return;
    }
    auto connection = connection_.lock();
    if (!connection) {
        return;
    }
    connection->wait_for_room(*this);
    if (cancelled_) {
        return;
    }
    streamed_ = true;
    connection->send_response(correlation_id_, std::move(payload), flags::kStreaming | extra, false);
}

void Responder::finish(std::vector<uint8_t> payload, protocol::Flags extra) {
    if (finished_.exchange(true)) {
        return;
    }
    auto connection = connection_.lock();
    if (!connection) {
        return;
    }
    protocol::Flags out = extra;
    if (streamed_) {
        out |= flags::kStreaming | flags::kLastChunk;
    }
    connection->send_response(correlation_id_, std::move(payload), out, true);
}

void Responder::fail(const std::string& message) {
    finish(std::vector<uint8_t>(message.begin(), message.end()), flags::kError);
}

std::optional<protocol::Capabilities> Responder::capabilities() const {
    auto connection = connection_.lock();
    if (!connection) {
        return std::nullopt;
    }
    auto negotiated = connection->negotiated();
    if (!negotiated) {
        return std::nullopt;
    }
    return negotiated->capabilities;
}

// --- Connection ---

std::shared_ptr<Connection> Connection::create(std::unique_ptr<Transport> transport, Role role,
                                               ConnectionConfig config, ConnectionCallbacks callbacks) {
    if (config.supported_versions.empty()) {
        throw Error(ErrorKind::UnsupportedVersion, "no supported protocol versions configured");
    }
    return std::shared_ptr<Connection>(
        new Connection(std::move(transport), role, std::move(config), std::move(callbacks)));
}

Connection::Connection(std::unique_ptr<Transport> transport, Role role, ConnectionConfig config,
                       ConnectionCallbacks callbacks)
    : transport_(std::move(transport)),
      executor_(transport_->get_executor()),
      role_(role),
      config_(std::move(config)),
      callbacks_(std::move(callbacks)),
      client_id_(config_.client_id.empty() ? security::generate_client_id() : config_.client_id),
      version_(*std::max_element(config_.supported_versions.begin(), config_.supported_versions.end())),
      max_outbound_payload_(config_.max_payload_size),
      codec_(config_.max_payload_size),
      mux_([this](uint64_t id, std::vector<uint8_t> payload, bool compress) {
               send_command(id, std::move(payload), compress);
           },
           config_.request_timeout),
      handshake_timer_(executor_),
      heartbeat_timer_(executor_),
      liveness_timer_(executor_),
      sweep_timer_(executor_),
      drain_timer_(executor_) {
    mux_.set_latency_observer([this](Clock::duration rtt) { link_stats_.record_rtt(rtt); });
}

void Connection::on_inbound_command(CommandHandler handler) {
    command_handler_ = std::move(handler);
}

void Connection::start() {
    auto self = shared_from_this();
    boost::asio::post(executor_, [self] {
        self->last_send_ = self->last_receive_ = Clock::now();
        log::debug(kComponent, "starting as " +
                   std::string(self->role_ == Role::Initiator ? "initiator" : "acceptor") +
                   " with " + self->remote_endpoint());
        self->arm_handshake_timer();
        if (self->role_ == Role::Initiator) {
            self->enqueue(self->encode_frame(MessageKind::Hello, 0, protocol::encode_hello(self->local_hello()),
                                             flags::kNone, false));
        }
        self->read_more();
    });
}

std::optional<Negotiated> Connection::negotiated() const {
    std::lock_guard<std::mutex> lock(negotiated_mutex_);
    return negotiated_;
}

RequestHandle Connection::submit(std::vector<uint8_t> payload, RequestOptions options) {
    const ConnectionState state = state_;
    if (state != ConnectionState::Active) {
        throw Error(ErrorKind::ConnectionLost, std::string("cannot submit while connection is ") + to_string(state));
    }
    return mux_.submit(std::move(payload), options);
}

bool Connection::cancel(uint64_t correlation_id, bool notify_peer) {
    const bool removed = mux_.cancel(correlation_id);
    auto self = shared_from_this();
    if (removed && notify_peer) {
        Frame frame = encode_frame(MessageKind::Cancel, correlation_id, {}, flags::kNone, false);
        boost::asio::post(executor_, [self, frame] {
            if (self->state_ == ConnectionState::Active || self->state_ == ConnectionState::Draining) {
                self->enqueue(frame);
            }
        });
    }
    boost::asio::post(executor_, [self] { self->maybe_finish_drain(); });
    return removed;
}

void Connection::shutdown() {
    auto self = shared_from_this();
    boost::asio::post(executor_, [self] {
        if (self->state_ == ConnectionState::Handshaking) {
            self->teardown(Error(ErrorKind::Cancelled, "shut down before the handshake completed"));
            return;
        }
        self->begin_draining(true);
    });
}

void Connection::abort(const Error& error) {
    auto self = shared_from_this();
    boost::asio::post(executor_, [self, error] { self->teardown(error); });
}

Connection::Frame Connection::encode_frame(MessageKind kind, uint64_t correlation_id, std::vector<uint8_t> payload,
                                           protocol::Flags packet_flags, bool allow_compress) const {
    if (allow_compress && compression_enabled_ && config_.compression_threshold > 0 &&
        payload.size() >= config_.compression_threshold) {
        auto packed = compression::compress(payload.data(), payload.size());
        if (packed.size() < payload.size()) {
            payload = std::move(packed);
            packet_flags |= flags::kCompressed;
        }
    }
    if (payload.size() > max_outbound_payload_) {
        throw Error(ErrorKind::FrameTooLarge, "payload of " + std::to_string(payload.size()) +
                                              " bytes exceeds the negotiated limit of " +
                                              std::to_string(max_outbound_payload_.load()));
    }
    protocol::Packet packet(kind, correlation_id, std::move(payload), packet_flags, version_);
    return std::make_shared<const std::vector<uint8_t>>(protocol::FrameCodec::encode(std::move(packet)));
}

protocol::Packet Connection::inflate(protocol::Packet&& packet) const {
    if (!packet.has_flag(flags::kCompressed)) {
        return std::move(packet);
    }
    std::vector<uint8_t> plain;
    try {
        plain = compression::decompress(packet.payload().data(), packet.payload().size(), config_.max_payload_size);
    } catch (const Error& e) {
        throw Error(ErrorKind::ProtocolViolation, std::string("undecodable compressed payload: ") + e.what());
    }
    return protocol::Packet(packet.kind(), packet.correlation_id(), std::move(plain),
                            packet.flags() & ~flags::kCompressed, packet.protocol_version());
}

void Connection::send_command(uint64_t correlation_id, std::vector<uint8_t> payload, bool compress) {
    Frame frame = encode_frame(MessageKind::Command, correlation_id, std::move(payload), flags::kNone, compress);
    auto self = shared_from_this();
    boost::asio::post(executor_, [self, frame] {
        if (self->state_ != ConnectionState::Closed) {
            self->enqueue(frame);
        }
    });
}

void Connection::send_response(uint64_t correlation_id, std::vector<uint8_t> payload, protocol::Flags packet_flags,
                               bool terminal) {
    Frame frame;
    try {
        frame = encode_frame(MessageKind::Response, correlation_id, std::move(payload), packet_flags, true);
    } catch (const Error& e) {
        if (!terminal) {
            throw;
        }
        // The waiter still needs its terminal response.
        log::warn(kComponent, "response " + std::to_string(correlation_id) + " replaced by error: " + e.what());
        const std::string message = e.what();
        frame = encode_frame(MessageKind::Response, correlation_id, std::vector<uint8_t>(message.begin(), message.end()),
                             flags::kError | (packet_flags & (flags::kStreaming | flags::kLastChunk)), false);
    }
    add_backlog(frame->size());
    auto self = shared_from_this();
    boost::asio::post(executor_, [self, frame, correlation_id, terminal] {
        if (self->state_ == ConnectionState::Closed) {
            self->release_backlog(frame->size());
            return;
        }
        auto it = self->inbound_.find(correlation_id);
        if (it == self->inbound_.end()) {
            log::debug(kComponent, "discarding output for cancelled command " + std::to_string(correlation_id));
            self->release_backlog(frame->size());
            return;
        }
        self->enqueue(frame, true);
        if (terminal) {
            self->inbound_.erase(it);
            self->maybe_finish_drain();
        }
    });
}

protocol::Hello Connection::local_hello() const {
    protocol::Hello hello;
    hello.client_id = client_id_;
    hello.versions = config_.supported_versions;
    hello.capabilities = config_.capabilities;
    hello.capabilities.max_payload_size = config_.max_payload_size;
    hello.timestamp_ms = now_ms();
    return hello;
}

// --- Inbound ---

void Connection::read_more() {
    auto self = shared_from_this();
    transport_->async_read_some(codec_.prepare(kReadSize),
        [self](const boost::system::error_code& ec, std::size_t size) { self->on_read(ec, size); });
}

void Connection::on_read(const boost::system::error_code& ec, std::size_t size) {
    if (state_ == ConnectionState::Closed) {
        return;
    }
    if (ec) {
        if (state_ == ConnectionState::Draining && drained()) {
            maybe_finish_drain();
            return;
        }
        teardown(Error(ErrorKind::ConnectionLost,
                       ec == boost::asio::error::eof ? "peer closed the stream" : ec.message()));
        return;
    }

    codec_.commit(size);
    last_receive_ = Clock::now();
    try {
        while (auto view = codec_.next()) {
            handle_packet(*view);
            if (state_ == ConnectionState::Closed) {
                return;
            }
        }
    } catch (const Error& e) {
        teardown(e);
        return;
    }
    read_more();
}

void Connection::handle_packet(const protocol::PacketView& view) {
    if (state_ == ConnectionState::Handshaking) {
        if (view.kind() != MessageKind::Hello) {
            throw Error(ErrorKind::ProtocolViolation,
                        std::string("expected Hello during handshake, got ") + protocol::to_string(view.kind()));
        }
        protocol::Hello hello;
        try {
            hello = protocol::decode_hello(view.payload, view.payload_size);
        } catch (const Error& e) {
            throw Error(ErrorKind::ProtocolViolation, std::string("malformed Hello: ") + e.what());
        }
        handle_hello(hello);
        return;
    }

    if (view.header.protocol_version != version_) {
        throw Error(ErrorKind::ProtocolViolation, "packet carries protocol version " +
                                                  std::to_string(view.header.protocol_version) +
                                                  ", negotiated " + std::to_string(version_.load()));
    }

    switch (view.kind()) {
        case MessageKind::Heartbeat:
            ++heartbeats_received_;
            return;
        case MessageKind::Command:
            handle_command(inflate(view.to_owned()));
            return;
        case MessageKind::Response:
            mux_.on_response(inflate(view.to_owned()));
            maybe_finish_drain();
            return;
        case MessageKind::Cancel:
            handle_cancel(view.header.correlation_id);
            return;
        case MessageKind::Goodbye:
            log::info(kComponent, "peer " + remote_endpoint() + " said goodbye");
            begin_draining(false);
            return;
        case MessageKind::Hello:
            throw Error(ErrorKind::ProtocolViolation, "Hello received after the handshake");
        case MessageKind::Unknown:
            break;
    }
    log::warn(kComponent, "dropping packet of unknown kind " + std::to_string(view.header.kind));
}

void Connection::handle_hello(const protocol::Hello& hello) {
    if (role_ == Role::Initiator) {
        if (!hello.accepted) {
            throw Error(ErrorKind::UnsupportedVersion, "peer rejected the handshake: " + hello.reason);
        }
        const auto& local = config_.supported_versions;
        if (std::find(local.begin(), local.end(), hello.selected_version) == local.end()) {
            throw Error(ErrorKind::UnsupportedVersion,
                        "peer selected unsupported version " + std::to_string(hello.selected_version));
        }
        activate(hello.selected_version, hello);
        return;
    }

    protocol::Hello reply = local_hello();
    auto version = protocol::negotiate_version(config_.supported_versions, hello.versions);
    if (!version) {
        reply.accepted = false;
        reply.reason = "no common protocol version";
        enqueue(encode_frame(MessageKind::Hello, 0, protocol::encode_hello(reply), flags::kNone, false));
        // The initiator still gets the reply before the stream closes.
        teardown(Error(ErrorKind::UnsupportedVersion, "no common protocol version with peer " + hello.client_id),
                 true);
        return;
    }
    reply.selected_version = *version;
    enqueue(encode_frame(MessageKind::Hello, 0, protocol::encode_hello(reply), flags::kNone, false));
    activate(*version, hello);
}

void Connection::activate(uint32_t version, const protocol::Hello& peer) {
    Negotiated negotiated;
    negotiated.version = version;
    negotiated.capabilities = protocol::negotiate(local_hello().capabilities, peer.capabilities);
    negotiated.peer_id = peer.client_id;

    version_ = version;
    compression_enabled_ = negotiated.capabilities.compression;
    max_outbound_payload_ = static_cast<std::size_t>(negotiated.capabilities.max_payload_size);
    {
        std::lock_guard<std::mutex> lock(negotiated_mutex_);
        negotiated_ = negotiated;
    }

    state_ = ConnectionState::Active;
    handshake_timer_.cancel();
    heartbeat_frame_ = encode_frame(MessageKind::Heartbeat, 0, {}, flags::kNone, false);
    schedule_heartbeat();
    schedule_liveness();
    schedule_sweep();

    log::info(kComponent, "active with " + peer.client_id + " at " + remote_endpoint() +
                          " (protocol v" + std::to_string(version) + ")");
    if (callbacks_.on_connected) {
        callbacks_.on_connected(negotiated);
    }
}

void Connection::handle_command(protocol::Packet&& command) {
    const uint64_t id = command.correlation_id();
    if (id == 0) {
        throw Error(ErrorKind::ProtocolViolation, "command uses reserved correlation id 0");
    }
    if (inbound_.count(id) > 0) {
        throw Error(ErrorKind::ProtocolViolation, "duplicate command id " + std::to_string(id) + " still executing");
    }

    auto responder = std::make_shared<Responder>(weak_from_this(), id);
    inbound_.emplace(id, responder);

    if (state_ == ConnectionState::Draining) {
        responder->fail("connection is draining");
        return;
    }
    if (!command_handler_) {
        responder->fail("no command handler installed");
        return;
    }
    try {
        DispatchScope scope(this);
        command_handler_(command, responder);
    } catch (const std::exception& e) {
        log::warn(kComponent, "command " + std::to_string(id) + " handler threw: " + e.what());
        responder->fail(e.what());
    }
}

void Connection::handle_cancel(uint64_t correlation_id) {
    auto it = inbound_.find(correlation_id);
    if (it == inbound_.end()) {
        log::debug(kComponent, "cancel for finished command " + std::to_string(correlation_id));
        return;
    }
    it->second->mark_cancelled();
    inbound_.erase(it);
    wake_writers();
    maybe_finish_drain();
}

// --- Outbound ---

void Connection::enqueue(Frame frame, bool accounted) {
    if (!accounted) {
        add_backlog(frame->size());
    }
    last_send_ = Clock::now();
    write_queue_.push_back(std::move(frame));
    if (!writing_) {
        write_next();
    }
}

void Connection::write_next() {
    writing_ = true;
    Frame frame = write_queue_.front();
    auto self = shared_from_this();
    transport_->async_write(boost::asio::buffer(*frame),
        [self, frame](const boost::system::error_code& ec, std::size_t size) { self->on_write(ec, size); });
}

void Connection::on_write(const boost::system::error_code& ec, std::size_t size) {
    writing_ = false;
    if (ec) {
        std::size_t dropped = 0;
        for (const auto& frame : write_queue_) {
            dropped += frame->size();
        }
        write_queue_.clear();
        release_backlog(dropped);
        if (state_ != ConnectionState::Closed) {
            teardown(Error(ErrorKind::ConnectionLost, "write failed: " + ec.message()));
        } else {
            transport_->close();
        }
        return;
    }
    link_stats_.record(size);
    release_backlog(write_queue_.front()->size());
    write_queue_.pop_front();
    if (!write_queue_.empty()) {
        write_next();
    } else if (close_when_flushed_) {
        drain_timer_.cancel();
        transport_->close();
    }
}

void Connection::add_backlog(std::size_t bytes) {
    std::lock_guard<std::mutex> lock(backlog_mutex_);
    backlog_bytes_ += bytes;
}

void Connection::release_backlog(std::size_t bytes) {
    {
        std::lock_guard<std::mutex> lock(backlog_mutex_);
        backlog_bytes_ -= std::min(bytes, backlog_bytes_);
    }
    backlog_cv_.notify_all();
}

void Connection::wake_writers() {
    // Taking the lock orders the caller's state change before the waiters' predicate check.
    { std::lock_guard<std::mutex> lock(backlog_mutex_); }
    backlog_cv_.notify_all();
}

void Connection::wait_for_room(const Responder& responder) {
    // The io thread itself drains the queue; it must never wait here.
    if (config_.write_high_water == 0 || dispatching == this) {
        return;
    }
    std::unique_lock<std::mutex> lock(backlog_mutex_);
    backlog_cv_.wait(lock, [&] {
        return backlog_bytes_ < config_.write_high_water || state_ == ConnectionState::Closed ||
               responder.cancelled();
    });
}

std::size_t Connection::write_backlog() const {
    std::lock_guard<std::mutex> lock(backlog_mutex_);
    return backlog_bytes_;
}

// --- Timers ---

void Connection::arm_handshake_timer() {
    auto self = shared_from_this();
    handshake_timer_.expires_after(config_.handshake_timeout);
    handshake_timer_.async_wait([self](const boost::system::error_code& ec) {
        if (ec || self->state_ != ConnectionState::Handshaking) {
            return;
        }
        self->teardown(Error(ErrorKind::Timeout, "handshake not completed within " + ms(self->config_.handshake_timeout)));
    });
}

void Connection::schedule_heartbeat() {
    auto self = shared_from_this();
    heartbeat_timer_.expires_at(last_send_ + config_.heartbeat_interval);
    heartbeat_timer_.async_wait([self](const boost::system::error_code& ec) {
        if (ec || self->state_ == ConnectionState::Closed) {
            return;
        }
        // Other traffic since the timer was armed pushes the deadline back.
        if (Clock::now() - self->last_send_ >= self->config_.heartbeat_interval) {
            self->enqueue(self->heartbeat_frame_);
            ++self->heartbeats_sent_;
        }
        self->schedule_heartbeat();
    });
}

void Connection::schedule_liveness() {
    if (config_.peer_timeout.count() <= 0) {
        return;
    }
    auto self = shared_from_this();
    liveness_timer_.expires_at(last_receive_ + config_.peer_timeout);
    liveness_timer_.async_wait([self](const boost::system::error_code& ec) {
        if (ec || self->state_ == ConnectionState::Closed) {
            return;
        }
        if (Clock::now() - self->last_receive_ >= self->config_.peer_timeout) {
            self->teardown(Error(ErrorKind::ConnectionLost,
                                 "no traffic from peer for " + ms(self->config_.peer_timeout)));
            return;
        }
        self->schedule_liveness();
    });
}

void Connection::schedule_sweep() {
    auto self = shared_from_this();
    sweep_timer_.expires_after(config_.sweep_interval);
    sweep_timer_.async_wait([self](const boost::system::error_code& ec) {
        if (ec || self->state_ == ConnectionState::Closed) {
            return;
        }
        self->mux_.expire_overdue(Clock::now());
        self->maybe_finish_drain();
        if (self->state_ != ConnectionState::Closed) {
            self->schedule_sweep();
        }
    });
}

// --- Teardown ---

void Connection::begin_draining(bool local) {
    if (state_ != ConnectionState::Active) {
        return;
    }
    state_ = ConnectionState::Draining;
    enqueue(encode_frame(MessageKind::Goodbye, 0, {}, flags::kNone, false));
    log::info(kComponent, std::string(local ? "shutting down" : "draining after peer goodbye") + ", " +
                          std::to_string(mux_.pending_count()) + " outbound and " +
                          std::to_string(inbound_.size()) + " inbound in flight");

    auto self = shared_from_this();
    drain_timer_.expires_after(config_.drain_timeout);
    drain_timer_.async_wait([self](const boost::system::error_code& ec) {
        if (ec || self->state_ != ConnectionState::Draining) {
            return;
        }
        self->teardown(Error(ErrorKind::ConnectionLost, "drain did not complete within " +
                                                        ms(self->config_.drain_timeout)));
    });
    maybe_finish_drain();
}

bool Connection::drained() const {
    return mux_.pending_count() == 0 && inbound_.empty();
}

void Connection::maybe_finish_drain() {
    if (state_ != ConnectionState::Draining || !drained()) {
        return;
    }
    state_ = ConnectionState::Closed;
    cancel_timers();
    mux_.fail_all(Error(ErrorKind::ConnectionLost, "connection closed"));
    log::info(kComponent, "drained, closing " + remote_endpoint());
    close_transport(true);
    if (callbacks_.on_closed) {
        callbacks_.on_closed();
    }
}

void Connection::teardown(const Error& error, bool flush) {
    if (state_ == ConnectionState::Closed) {
        return;
    }
    state_ = ConnectionState::Closed;
    cancel_timers();
    log::warn(kComponent, "closing " + remote_endpoint() + ": " + error.what());

    mux_.fail_all(error);
    for (auto& entry : inbound_) {
        entry.second->mark_cancelled();
    }
    inbound_.clear();
    wake_writers();
    close_transport(flush);

    if (callbacks_.on_disconnected) {
        callbacks_.on_disconnected(error);
    }
    if (callbacks_.on_closed) {
        callbacks_.on_closed();
    }
}

void Connection::cancel_timers() {
    handshake_timer_.cancel();
    heartbeat_timer_.cancel();
    liveness_timer_.cancel();
    sweep_timer_.cancel();
    drain_timer_.cancel();
}

void Connection::close_transport(bool flush) {
    if (!flush || !writing_) {
        transport_->close();
        return;
    }
    close_when_flushed_ = true;
    // A peer that stopped reading gets drain_timeout to take the rest.
    auto self = shared_from_this();
    drain_timer_.expires_after(config_.drain_timeout);
    drain_timer_.async_wait([self](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        log::debug(kComponent, "final flush timed out, closing");
        self->transport_->close();
    });
}

} // namespace tether::networking
