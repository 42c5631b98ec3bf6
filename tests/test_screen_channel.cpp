#include <gtest/gtest.h>
#include "test_support.hpp"
#include "tether/networking/screen_channel.hpp"

using namespace tether;
using namespace tether::networking;
using namespace tether::test_support;
using boost::asio::ip::udp;

namespace {

transfer::EncodedFrame make_frame(uint64_t id, std::size_t size) {
    transfer::EncodedFrame frame;
    frame.frame_id = id;
    frame.timestamp_ms = 5000 + id;
    frame.width = 1280;
    frame.height = 720;
    frame.full_frame = id == 1;
    frame.data.assign(size, static_cast<uint8_t>(id));
    return frame;
}

class ScreenChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        receiver_ = ScreenReceiver::create(io_.io().get_executor(),
                                           udp::endpoint(boost::asio::ip::address_v4::loopback(), 0), config_,
                                           [this](transfer::EncodedFrame&& frame) {
                                               std::lock_guard<std::mutex> lock(mutex_);
                                               frames_.push_back(std::move(frame));
                                           });
        receiver_->start();
        sender_ = ScreenSender::create(io_.io().get_executor(),
                                       udp::endpoint(boost::asio::ip::address_v4::loopback(), receiver_->port()),
                                       config_);
    }

    void TearDown() override {
        sender_->close();
        receiver_->stop();
        io_.stop();
    }

    std::size_t frame_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return frames_.size();
    }

    IoThread io_;
    StreamConfig config_;
    std::shared_ptr<ScreenReceiver> receiver_;
    std::shared_ptr<ScreenSender> sender_;
    std::mutex mutex_;
    std::vector<transfer::EncodedFrame> frames_;
};

} // namespace

TEST_F(ScreenChannelTest, FramesCrossLoopback) {
    for (uint64_t id = 1; id <= 5; ++id) {
        auto frame = make_frame(id, 20 * 1024 + id);
        const uint32_t sequence = sender_->send(frame);
        EXPECT_EQ(sequence, id - 1);
        ASSERT_TRUE(eventually([&] { return frame_count() == id; }));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (std::size_t i = 0; i < frames_.size(); ++i) {
        EXPECT_EQ(frames_[i].frame_id, i + 1);
        EXPECT_EQ(frames_[i].sequence, i);
        EXPECT_EQ(frames_[i].data, make_frame(i + 1, 20 * 1024 + i + 1).data);
        EXPECT_EQ(frames_[i].width, 1280u);
    }
    EXPECT_TRUE(frames_[0].full_frame);
    EXPECT_EQ(receiver_->stats().delivered, 5u);
    EXPECT_TRUE(eventually([&] { return sender_->bandwidth().total_bytes() > 5u * 20 * 1024; }));
    EXPECT_EQ(sender_->send_errors(), 0u);
}

TEST_F(ScreenChannelTest, LateDatagramsForOldFramesAreDropped) {
    transfer::FrameSplitter splitter(config_, 40);
    auto old_frame = make_frame(1, 3000);
    auto new_frame = make_frame(2, 3000);
    auto old_datagrams = splitter.split(old_frame);
    auto new_datagrams = splitter.split(new_frame);

    udp::socket raw(io_.io(), udp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
    const udp::endpoint target(boost::asio::ip::address_v4::loopback(), receiver_->port());
    raw.send_to(boost::asio::buffer(old_datagrams[0]), target);
    for (const auto& datagram : new_datagrams) {
        raw.send_to(boost::asio::buffer(datagram), target);
    }
    ASSERT_TRUE(eventually([&] { return frame_count() == 1; }));
    for (std::size_t i = 1; i < old_datagrams.size(); ++i) {
        raw.send_to(boost::asio::buffer(old_datagrams[i]), target);
    }
    ASSERT_TRUE(eventually([&] { return receiver_->stats().stale == old_datagrams.size() - 1; }));

    std::lock_guard<std::mutex> lock(mutex_);
    EXPECT_EQ(frames_[0].sequence, 41u);
    EXPECT_EQ(receiver_->stats().discarded, 1u);
    EXPECT_EQ(frames_.size(), 1u);
}
