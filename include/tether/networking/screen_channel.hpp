#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>
#include <boost/asio.hpp>
#include "tether/config.hpp"
#include "tether/transfer/bandwidth.hpp"
#include "tether/transfer/frame_stream.hpp"

namespace tether::networking {

// Sends encoded frames as sub-chunk datagrams over UDP. Losses are never
// repaired; the receiver only keeps the newest frame.
class ScreenSender : public std::enable_shared_from_this<ScreenSender> {
public:
    static std::shared_ptr<ScreenSender> create(boost::asio::any_io_executor executor,
                                                const boost::asio::ip::udp::endpoint& remote,
                                                const StreamConfig& config = {}, uint32_t first_sequence = 0);

    // Splits on the calling thread and queues the datagrams; returns the
    // frame's sequence number. Call from one thread at a time.
    uint32_t send(transfer::EncodedFrame frame);

    void close();

    uint32_t next_sequence() const { return splitter_.next_sequence(); }
    const transfer::BandwidthEstimator& bandwidth() const { return bandwidth_; }
    uint64_t send_errors() const { return send_errors_; }

private:
    ScreenSender(boost::asio::any_io_executor executor, const boost::asio::ip::udp::endpoint& remote,
                 const StreamConfig& config, uint32_t first_sequence);

    boost::asio::ip::udp::socket socket_;
    boost::asio::ip::udp::endpoint remote_;
    transfer::FrameSplitter splitter_;
    transfer::BandwidthEstimator bandwidth_;
    std::atomic<uint64_t> send_errors_{0};
};

class ScreenReceiver : public std::enable_shared_from_this<ScreenReceiver> {
public:
    using FrameCallback = std::function<void(transfer::EncodedFrame&& frame)>;

    // Binds immediately; port 0 picks a free port.
    static std::shared_ptr<ScreenReceiver> create(boost::asio::any_io_executor executor,
                                                  const boost::asio::ip::udp::endpoint& local,
                                                  const StreamConfig& config, FrameCallback on_frame);

    void start();
    void stop();

    uint16_t port() const;
    transfer::ReassemblyStats stats() const;

private:
    ScreenReceiver(boost::asio::any_io_executor executor, const boost::asio::ip::udp::endpoint& local,
                   const StreamConfig& config, FrameCallback on_frame);

    void receive();

    boost::asio::ip::udp::socket socket_;
    boost::asio::ip::udp::endpoint sender_;
    std::vector<uint8_t> buffer_;
    FrameCallback on_frame_;
    mutable std::mutex mutex_;
    transfer::FrameReassembler reassembler_;
    std::atomic<bool> stopped_{false};
};

} // namespace tether::networking
