#include "tether/networking/remote_services.hpp"
#include "tether/error.hpp"
#include "tether/log.hpp"
#include "tether/protocol/json_body.hpp"

namespace tether::networking {

using boost::asio::ip::udp;
using protocol::CommandId;
using protocol::CommandView;
using protocol::decode_json;
using protocol::encode_json;

namespace {

constexpr uint32_t kMaxFps = 120;

// Waits for the terminal response; an error-flagged one becomes RemoteFailure.
protocol::Packet await_success(RequestHandle& handle) {
    protocol::Packet terminal = handle.result.get();
    if (terminal.has_flag(protocol::flags::kError)) {
        throw Error(ErrorKind::RemoteFailure, std::string(terminal.payload().begin(), terminal.payload().end()));
    }
    return terminal;
}

} // namespace

// --- ShellService ---

ShellService::ShellService(boost::asio::thread_pool& pool, ShellRunner runner)
    : pool_(pool), runner_(std::move(runner)) {}

void ShellService::register_with(protocol::CommandRouter& router) {
    router.add(CommandId::ShellExecute, [this](const CommandView& command, std::shared_ptr<Responder> responder) {
        std::vector<uint8_t> body(command.body, command.body + command.body_size);
        boost::asio::post(pool_, [this, body, responder] { run(body, *responder); });
    });
}

void ShellService::run(const std::vector<uint8_t>& body, Responder& responder) {
    protocol::ShellRequest request;
    try {
        request = decode_json<protocol::ShellRequest>(body.data(), body.size(), "shell request");
    } catch (const Error& e) {
        responder.fail(e.what());
        return;
    }
    log::info("shell", "running: " + request.command);

    uint64_t chunks = 0;
    const ShellEmit emit = [&responder, &chunks](protocol::OutputStream stream, std::vector<uint8_t> data) {
        if (data.empty()) {
            return;
        }
        protocol::ShellOutput output;
        output.stream = stream;
        output.data = std::move(data);
        responder.send_fragment(protocol::encode_shell_output(output));
        ++chunks;
    };
    const std::function<bool()> cancelled = [&responder] { return responder.cancelled(); };

    protocol::ShellExit status;
    try {
        status.exit_code = runner_(request, emit, cancelled);
    } catch (const std::exception& e) {
        log::warn("shell", "could not run " + request.command + ": " + e.what());
        status.exit_code = -1;
        status.error = e.what();
    }
    status.total_chunks = chunks;
    responder.finish(encode_json(status));
}

// --- ScreenService ---

std::shared_ptr<ScreenService> ScreenService::create(boost::asio::io_context& io, FrameSource source,
                                                     const StreamConfig& config) {
    return std::shared_ptr<ScreenService>(new ScreenService(io, std::move(source), config));
}

ScreenService::ScreenService(boost::asio::io_context& io, FrameSource source, const StreamConfig& config)
    : strand_(boost::asio::make_strand(io)),
      source_(std::move(source)),
      config_(config),
      timer_(strand_) {}

void ScreenService::register_with(protocol::CommandRouter& router) {
    auto self = shared_from_this();
    router.add(CommandId::ScreenStart, [self](const CommandView& command, std::shared_ptr<Responder> responder) {
        protocol::ScreenStartRequest request;
        udp::endpoint remote;
        try {
            request = decode_json<protocol::ScreenStartRequest>(command.body, command.body_size, "screen request");
            if (request.fps == 0 || request.fps > kMaxFps || request.port == 0) {
                throw Error(ErrorKind::Encoding, "screen request needs 1.." + std::to_string(kMaxFps) +
                                                 " fps and a port, got " + std::to_string(request.fps) + " fps, port " +
                                                 std::to_string(request.port));
            }
            remote = udp::endpoint(boost::asio::ip::make_address(request.host), request.port);
        } catch (const Error& e) {
            responder->fail(e.what());
            return;
        } catch (const boost::system::system_error& e) {
            responder->fail("bad stream address " + request.host + ": " + e.what());
            return;
        }
        boost::asio::post(self->strand_, [self, request, remote, responder] { self->start(request, remote, responder); });
    });
    router.add(CommandId::ScreenStop, [self](const CommandView&, std::shared_ptr<Responder> responder) {
        boost::asio::post(self->strand_, [self, responder] {
            self->stop_stream();
            responder->finish();
        });
    });
}

void ScreenService::stop() {
    auto self = shared_from_this();
    boost::asio::post(strand_, [self] { self->stop_stream(); });
}

void ScreenService::start(const protocol::ScreenStartRequest& request, const udp::endpoint& remote,
                          std::shared_ptr<Responder> responder) {
    stop_stream();
    try {
        sender_ = ScreenSender::create(strand_, remote, config_, next_sequence_);
    } catch (const boost::system::system_error& e) {
        responder->fail(std::string("cannot open stream socket: ") + e.what());
        return;
    }
    request_ = request;
    streaming_ = true;
    log::info("screen", "streaming monitor " + std::to_string(request.monitor) + " to " + request.host + ":" +
                        std::to_string(request.port) + " at " + std::to_string(request.fps) + " fps");

    protocol::ScreenStartReply reply;
    reply.fps = request.fps;
    reply.mtu = static_cast<uint32_t>(config_.mtu);
    reply.first_sequence = next_sequence_;
    responder->finish(encode_json(reply));
    schedule_tick();
}

void ScreenService::stop_stream() {
    timer_.cancel();
    ++generation_;
    streaming_ = false;
    if (!sender_) {
        return;
    }
    next_sequence_ = sender_->next_sequence();
    sender_->close();
    sender_.reset();
    log::info("screen", "stream stopped after " + std::to_string(frames_sent_.load()) + " frames");
}

void ScreenService::schedule_tick() {
    auto self = shared_from_this();
    const uint64_t generation = generation_;
    timer_.expires_after(std::chrono::milliseconds(1000 / request_.fps));
    timer_.async_wait([self, generation](const boost::system::error_code& ec) {
        if (ec || generation != self->generation_ || !self->sender_) {
            return;
        }
        std::optional<transfer::EncodedFrame> frame;
        try {
            frame = self->source_(self->request_);
        } catch (const std::exception& e) {
            log::warn("screen", std::string("capture failed: ") + e.what());
        }
        if (frame) {
            try {
                self->sender_->send(std::move(*frame));
                ++self->frames_sent_;
            } catch (const Error& e) {
                log::warn("screen", std::string("frame dropped: ") + e.what());
            }
        }
        self->schedule_tick();
    });
}

// --- Controller side ---

protocol::ShellExit execute_shell(Connection& connection, const protocol::ShellRequest& request,
                                  std::function<void(const protocol::ShellOutput&)> on_output) {
    RequestOptions options;
    if (on_output) {
        options.on_fragment = [on_output](const protocol::Packet& fragment) {
            on_output(protocol::decode_shell_output(fragment.payload().data(), fragment.payload().size()));
        };
    }
    auto handle = connection.submit(protocol::encode_command(CommandId::ShellExecute, encode_json(request)), options);
    protocol::Packet terminal = await_success(handle);
    return decode_json<protocol::ShellExit>(terminal.payload().data(), terminal.payload().size(), "shell exit status");
}

protocol::ScreenStartReply start_screen(Connection& connection, const protocol::ScreenStartRequest& request) {
    auto handle = connection.submit(protocol::encode_command(CommandId::ScreenStart, encode_json(request)));
    protocol::Packet terminal = await_success(handle);
    return decode_json<protocol::ScreenStartReply>(terminal.payload().data(), terminal.payload().size(),
                                                   "screen start reply");
}

void stop_screen(Connection& connection) {
    auto handle = connection.submit(protocol::encode_command(CommandId::ScreenStop, {}));
    await_success(handle);
}

} // namespace tether::networking
