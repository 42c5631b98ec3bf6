#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <boost/asio.hpp>
#include "tether/config.hpp"
#include "tether/networking/connection.hpp"
#include "tether/networking/screen_channel.hpp"
#include "tether/protocol/command.hpp"
#include "tether/protocol/screen.hpp"
#include "tether/protocol/shell.hpp"
#include "tether/transfer/frame_stream.hpp"

namespace tether::networking {

// Forwards one piece of command output to the requester.
using ShellEmit = std::function<void(protocol::OutputStream stream, std::vector<uint8_t> data)>;

// The embedding application's shell executor. Runs request, reporting output
// through emit as it appears and polling cancelled; returns the exit code.
// Throwing means the command could not be run.
using ShellRunner = std::function<int32_t(const protocol::ShellRequest& request, const ShellEmit& emit,
                                          const std::function<bool()>& cancelled)>;

// Target side of ShellExecute. Runs each command on pool; output goes back
// as streaming fragments, the ShellExit as the terminal response.
class ShellService {
public:
    ShellService(boost::asio::thread_pool& pool, ShellRunner runner);

    void register_with(protocol::CommandRouter& router);

private:
    void run(const std::vector<uint8_t>& body, Responder& responder);

    boost::asio::thread_pool& pool_;
    ShellRunner runner_;
};

// The embedding application's capture provider: the next encoded frame, or
// nothing when there is none to send this tick.
using FrameSource = std::function<std::optional<transfer::EncodedFrame>(const protocol::ScreenStartRequest& request)>;

// Target side of ScreenStart/ScreenStop. One stream at a time: a new
// ScreenStart replaces the running one. Sequence numbers continue across
// streams so a receiver kept by the controller never sees them go back.
class ScreenService : public std::enable_shared_from_this<ScreenService> {
public:
    static std::shared_ptr<ScreenService> create(boost::asio::io_context& io, FrameSource source,
                                                 const StreamConfig& config = {});

    void register_with(protocol::CommandRouter& router);

    // Ends the running stream, if any.
    void stop();

    bool streaming() const { return streaming_; }
    uint64_t frames_sent() const { return frames_sent_; }

private:
    ScreenService(boost::asio::io_context& io, FrameSource source, const StreamConfig& config);

    void start(const protocol::ScreenStartRequest& request, const boost::asio::ip::udp::endpoint& remote,
               std::shared_ptr<Responder> responder);
    void stop_stream();
    void schedule_tick();

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    FrameSource source_;
    StreamConfig config_;
    boost::asio::steady_timer timer_;
    std::shared_ptr<ScreenSender> sender_;
    protocol::ScreenStartRequest request_;
    uint32_t next_sequence_ = 0;
    uint64_t generation_ = 0;
    std::atomic<bool> streaming_{false};
    std::atomic<uint64_t> frames_sent_{0};
};

// Controller side. Both block the calling thread; never call them from the
// connection's io thread. Failures arrive as tether::Error, RemoteFailure
// when the target refused or could not run the command.

// Runs request on the target; on_output sees each fragment on the io thread.
protocol::ShellExit execute_shell(Connection& connection, const protocol::ShellRequest& request,
                                  std::function<void(const protocol::ShellOutput&)> on_output = nullptr);

protocol::ScreenStartReply start_screen(Connection& connection, const protocol::ScreenStartRequest& request);
void stop_screen(Connection& connection);

} // namespace tether::networking
