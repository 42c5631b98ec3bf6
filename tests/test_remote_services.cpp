#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>
#include "test_support.hpp"
#include "tether/error.hpp"
#include "tether/networking/remote_services.hpp"

using namespace tether;
using namespace tether::networking;
using namespace tether::test_support;
using boost::asio::ip::udp;
using protocol::OutputStream;
using protocol::ShellOutput;
using protocol::ShellRequest;
using std::chrono::milliseconds;

namespace {

template <typename Call>
ErrorKind failure_of(Call call) {
    try {
        call();
    } catch (const Error& e) {
        return e.kind();
    }
    ADD_FAILURE() << "call succeeded unexpectedly";
    return ErrorKind::Encoding;
}

int32_t echo_runner(const ShellRequest& request, const ShellEmit& emit, const std::function<bool()>&) {
    emit(OutputStream::Stdout, bytes("ran " + request.command + "\n"));
    emit(OutputStream::Stderr, bytes("warning\n"));
    emit(OutputStream::Stdout, {});
    return request.env.count("FAIL") > 0 ? 3 : 0;
}

class RemoteServicesTest : public ::testing::Test {
protected:
    void TearDown() override {
        if (receiver_) {
            receiver_->stop();
        }
        if (screen_) {
            screen_->stop();
        }
        if (controller_) {
            controller_->abort(Error(ErrorKind::ConnectionLost, "test finished"));
        }
        pool_.join();
        io_.stop();
    }

    void open(ConnectionConfig target_config = test_config()) {
        auto transports = local_transport_pair(io_.io());
        controller_ = Connection::create(std::move(transports.first), Role::Initiator, test_config(),
                                         controller_events_.callbacks());
        target_ = Connection::create(std::move(transports.second), Role::Acceptor, std::move(target_config),
                                     target_events_.callbacks());
        target_->on_inbound_command(std::cref(router_));
        target_->start();
        controller_->start();
        ASSERT_TRUE(controller_events_.wait([](Events& e) { return e.connected == 1; }));
    }

    void serve_screen() {
        screen_ = ScreenService::create(io_.io(), [this](const protocol::ScreenStartRequest&) {
            transfer::EncodedFrame frame;
            frame.frame_id = ++next_frame_id_;
            frame.width = 800;
            frame.height = 600;
            frame.data.assign(3000, static_cast<uint8_t>(next_frame_id_));
            return std::optional<transfer::EncodedFrame>(std::move(frame));
        });
        screen_->register_with(router_);
    }

    void listen() {
        receiver_ = ScreenReceiver::create(io_.io().get_executor(), udp::endpoint(boost::asio::ip::address_v4::loopback(), 0),
                                           StreamConfig{}, [this](transfer::EncodedFrame&&) { ++frames_received_; });
        receiver_->start();
    }

    protocol::ScreenStartRequest screen_request(uint32_t fps = 50) const {
        protocol::ScreenStartRequest request;
        request.host = "127.0.0.1";
        request.port = receiver_->port();
        request.fps = fps;
        return request;
    }

    IoThread io_;
    boost::asio::thread_pool pool_{2};
    protocol::CommandRouter router_;
    std::unique_ptr<ShellService> shell_;
    std::shared_ptr<ScreenService> screen_;
    std::shared_ptr<ScreenReceiver> receiver_;
    uint64_t next_frame_id_ = 0;
    std::atomic<uint64_t> frames_received_{0};
    Events controller_events_;
    Events target_events_;
    std::shared_ptr<Connection> controller_;
    std::shared_ptr<Connection> target_;
};

} // namespace

TEST(ShellOutputTest, StreamTagLeadsRawBytes) {
    ShellOutput output;
    output.stream = OutputStream::Stderr;
    output.data = {0x00, 0xFF, 'x'};
    auto payload = protocol::encode_shell_output(output);
    ASSERT_EQ(payload.size(), 4u);
    EXPECT_EQ(payload[0], 2);

    auto decoded = protocol::decode_shell_output(payload.data(), payload.size());
    EXPECT_EQ(decoded.stream, OutputStream::Stderr);
    EXPECT_EQ(decoded.data, output.data);

    const uint8_t unknown[] = {9, 'a'};
    EXPECT_THROW(protocol::decode_shell_output(unknown, sizeof(unknown)), Error);
    EXPECT_THROW(protocol::decode_shell_output(nullptr, 0), Error);
}

TEST_F(RemoteServicesTest, ShellOutputStreamsBeforeExitStatus) {
    shell_ = std::make_unique<ShellService>(pool_, echo_runner);
    shell_->register_with(router_);
    open();

    ShellRequest request;
    request.command = "uptime";
    request.env["FAIL"] = "1";
    std::vector<ShellOutput> outputs;
    auto status = execute_shell(*controller_, request, [&outputs](const ShellOutput& o) { outputs.push_back(o); });

    EXPECT_EQ(status.exit_code, 3);
    EXPECT_EQ(status.total_chunks, 2u);
    EXPECT_TRUE(status.error.empty());
    ASSERT_EQ(outputs.size(), 2u);
    EXPECT_EQ(outputs[0].stream, OutputStream::Stdout);
    EXPECT_EQ(text(outputs[0].data), "ran uptime\n");
    EXPECT_EQ(outputs[1].stream, OutputStream::Stderr);
}

TEST_F(RemoteServicesTest, RunnerFailureIsReportedInExitStatus) {
    shell_ = std::make_unique<ShellService>(pool_, [](const ShellRequest&, const ShellEmit&, const std::function<bool()>&) -> int32_t {
        throw std::runtime_error("no shell available");
    });
    shell_->register_with(router_);
    open();

    ShellRequest request;
    request.command = "ls";
    auto status = execute_shell(*controller_, request);
    EXPECT_EQ(status.exit_code, -1);
    EXPECT_EQ(status.error, "no shell available");
    EXPECT_EQ(status.total_chunks, 0u);
}

TEST_F(RemoteServicesTest, CommandsNeedTheirNegotiatedCapability) {
    shell_ = std::make_unique<ShellService>(pool_, echo_runner);
    shell_->register_with(router_);
    serve_screen();
    listen();
    ConnectionConfig config = test_config();
    config.capabilities.shell_streaming = false;
    config.capabilities.screen_capture = false;
    open(config);

    auto negotiated = controller_->negotiated();
    ASSERT_TRUE(negotiated.has_value());
    EXPECT_FALSE(negotiated->capabilities.shell_streaming);
    EXPECT_TRUE(negotiated->capabilities.file_delta_sync);

    ShellRequest request;
    request.command = "whoami";
    EXPECT_EQ(failure_of([&] { execute_shell(*controller_, request); }), ErrorKind::RemoteFailure);
    EXPECT_EQ(failure_of([&] { start_screen(*controller_, screen_request()); }), ErrorKind::RemoteFailure);
    EXPECT_FALSE(screen_->streaming());

    // Commands without a capability still run.
    auto pong = controller_->submit(protocol::encode_command(protocol::CommandId::Ping, bytes("hi"))).result.get();
    EXPECT_EQ(text(pong.payload()), "hi");
}

TEST_F(RemoteServicesTest, ScreenStreamsUntilStopped) {
    serve_screen();
    listen();
    open();

    auto reply = start_screen(*controller_, screen_request());
    EXPECT_EQ(reply.fps, 50u);
    EXPECT_EQ(reply.first_sequence, 0u);
    EXPECT_TRUE(screen_->streaming());
    ASSERT_TRUE(eventually([&] { return frames_received_ >= 3; }));

    stop_screen(*controller_);
    EXPECT_FALSE(screen_->streaming());
    const uint64_t sent = screen_->frames_sent();
    std::this_thread::sleep_for(milliseconds(100));
    EXPECT_EQ(screen_->frames_sent(), sent);

    // A new stream continues the sequence, so the same receiver accepts it.
    const uint64_t before = frames_received_;
    auto again = start_screen(*controller_, screen_request());
    EXPECT_EQ(again.first_sequence, sent);
    EXPECT_TRUE(eventually([&] { return frames_received_ > before + 2; }));
}

TEST_F(RemoteServicesTest, MalformedScreenRequestIsRefused) {
    serve_screen();
    listen();
    open();

    EXPECT_EQ(failure_of([&] { start_screen(*controller_, screen_request(0)); }), ErrorKind::RemoteFailure);
    auto bad_host = screen_request();
    bad_host.host = "not an address";
    EXPECT_EQ(failure_of([&] { start_screen(*controller_, bad_host); }), ErrorKind::RemoteFailure);
    EXPECT_FALSE(screen_->streaming());
}
