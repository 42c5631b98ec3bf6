#include "tether/networking/screen_channel.hpp"
#include "tether/log.hpp"

namespace tether::networking {

using boost::asio::ip::udp;

namespace {

// Largest UDP payload; anything the sender's MTU allows fits.
constexpr std::size_t kMaxDatagram = 65507;

} // namespace

// --- ScreenSender ---

std::shared_ptr<ScreenSender> ScreenSender::create(boost::asio::any_io_executor executor, const udp::endpoint& remote,
                                                   const StreamConfig& config, uint32_t first_sequence) {
    return std::shared_ptr<ScreenSender>(new ScreenSender(std::move(executor), remote, config, first_sequence));
}

ScreenSender::ScreenSender(boost::asio::any_io_executor executor, const udp::endpoint& remote,
                           const StreamConfig& config, uint32_t first_sequence)
    : socket_(std::move(executor), udp::endpoint(remote.protocol(), 0)),
      remote_(remote),
      splitter_(config, first_sequence) {}

uint32_t ScreenSender::send(transfer::EncodedFrame frame) {
    auto datagrams = std::make_shared<std::vector<std::vector<uint8_t>>>(splitter_.split(frame));
    const uint32_t sequence = frame.sequence;

    auto self = shared_from_this();
    boost::asio::post(socket_.get_executor(), [self, datagrams] {
        for (const auto& datagram : *datagrams) {
            self->socket_.async_send_to(boost::asio::buffer(datagram), self->remote_,
                [self, datagrams](const boost::system::error_code& ec, std::size_t size) {
                    if (ec) {
                        ++self->send_errors_;
                        log::debug("screen", "datagram send failed: " + ec.message());
                        return;
                    }
                    self->bandwidth_.record(size);
                });
        }
    });
    return sequence;
}

void ScreenSender::close() {
    auto self = shared_from_this();
    boost::asio::post(socket_.get_executor(), [self] {
        boost::system::error_code ec;
        self->socket_.close(ec);
    });
}

// --- ScreenReceiver ---

std::shared_ptr<ScreenReceiver> ScreenReceiver::create(boost::asio::any_io_executor executor,
                                                       const udp::endpoint& local, const StreamConfig& config,
                                                       FrameCallback on_frame) {
    return std::shared_ptr<ScreenReceiver>(new ScreenReceiver(std::move(executor), local, config, std::move(on_frame)));
}

ScreenReceiver::ScreenReceiver(boost::asio::any_io_executor executor, const udp::endpoint& local,
                               const StreamConfig& config, FrameCallback on_frame)
    : socket_(std::move(executor), local),
      buffer_(kMaxDatagram),
      on_frame_(std::move(on_frame)),
      reassembler_(config) {}

void ScreenReceiver::start() {
    auto self = shared_from_this();
    boost::asio::post(socket_.get_executor(), [self] { self->receive(); });
}

void ScreenReceiver::stop() {
    stopped_ = true;
    auto self = shared_from_this();
    boost::asio::post(socket_.get_executor(), [self] {
        boost::system::error_code ec;
        self->socket_.close(ec);
    });
}

uint16_t ScreenReceiver::port() const {
    return socket_.local_endpoint().port();
}

transfer::ReassemblyStats ScreenReceiver::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reassembler_.stats();
}

void ScreenReceiver::receive() {
    auto self = shared_from_this();
    socket_.async_receive_from(boost::asio::buffer(buffer_), sender_,
        [self](const boost::system::error_code& ec, std::size_t size) {
            if (self->stopped_ || ec == boost::asio::error::operation_aborted) {
                return;
            }
            if (ec) {
                // ICMP errors surface here on some platforms; the stream carries on.
                log::debug("screen", "receive failed: " + ec.message());
                self->receive();
                return;
            }

            std::optional<transfer::EncodedFrame> frame;
            {
                std::lock_guard<std::mutex> lock(self->mutex_);
                frame = self->reassembler_.push(self->buffer_.data(), size);
            }
            if (frame && self->on_frame_) {
                self->on_frame_(std::move(*frame));
            }
            self->receive();
        });
}

} // namespace tether::networking
