#include <gtest/gtest.h>
#include "tether/error.hpp"
#include "tether/networking/connection.hpp"
#include "tether/protocol/command.hpp"
#include "tether/protocol/hello.hpp"

using namespace tether;
using namespace tether::protocol;

TEST(HelloTest, NegotiatesHighestCommonVersion) {
    EXPECT_EQ(negotiate_version({1}, {1}), 1u);
    EXPECT_EQ(negotiate_version({1, 2, 3}, {2, 3, 4}), 3u);
    EXPECT_FALSE(negotiate_version({1}, {2}).has_value());
    EXPECT_FALSE(negotiate_version({1}, {}).has_value());
}

TEST(HelloTest, CapabilitiesIntersect) {
    Capabilities local;
    Capabilities remote;
    remote.compression = false;
    remote.max_payload_size = 1024;
    auto agreed = negotiate(local, remote);
    EXPECT_FALSE(agreed.compression);
    EXPECT_TRUE(agreed.file_delta_sync);
    EXPECT_EQ(agreed.max_payload_size, 1024u);
}

TEST(HelloTest, JsonRoundTrip) {
    Hello hello;
    hello.client_id = "a1b2c3d4e5f60718";
    hello.versions = {1, 2};
    hello.capabilities.screen_capture = false;
    hello.timestamp_ms = 1700000000000ull;
    hello.accepted = false;
    hello.reason = "no common protocol version";

    auto payload = encode_hello(hello);
    Hello decoded = decode_hello(payload.data(), payload.size());
    EXPECT_EQ(decoded.client_id, hello.client_id);
    EXPECT_EQ(decoded.versions, hello.versions);
    EXPECT_FALSE(decoded.capabilities.screen_capture);
    EXPECT_EQ(decoded.timestamp_ms, hello.timestamp_ms);
    EXPECT_FALSE(decoded.accepted);
    EXPECT_EQ(decoded.reason, hello.reason);
}

TEST(HelloTest, MalformedHelloIsEncodingError) {
    const std::string garbage = "{\"client_id\": 5";
    try {
        decode_hello(reinterpret_cast<const uint8_t*>(garbage.data()), garbage.size());
        FAIL();
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Encoding);
    }
}

TEST(CommandTest, EnvelopeCarriesIdAndBody) {
    auto payload = encode_command(CommandId::ShellExecute, {'l', 's'});
    ASSERT_EQ(payload.size(), 6u);
    EXPECT_EQ(payload[0], 2);

    auto view = decode_command(payload);
    EXPECT_EQ(view.id, CommandId::ShellExecute);
    EXPECT_EQ(std::string(view.body, view.body + view.body_size), "ls");
}

TEST(CommandTest, UnknownIdIsAVariantNotAFailure) {
    std::vector<uint8_t> payload = {0xE7, 0x03, 0x00, 0x00};
    auto view = decode_command(payload);
    EXPECT_EQ(view.id, CommandId::Unknown);
    EXPECT_EQ(view.raw_id, 999u);
    EXPECT_STREQ(to_string(view.id), "Unknown");
}

TEST(CommandTest, TruncatedEnvelopeThrows) {
    EXPECT_THROW(decode_command({0x01, 0x00}), Error);
}

TEST(CommandTest, CapabilitiesGateTheirCommands) {
    Capabilities none;
    none.shell_streaming = false;
    none.file_delta_sync = false;
    none.screen_capture = false;
    EXPECT_FALSE(permitted(CommandId::ShellExecute, none));
    EXPECT_FALSE(permitted(CommandId::FileRead, none));
    EXPECT_FALSE(permitted(CommandId::ScreenStop, none));
    EXPECT_TRUE(permitted(CommandId::Ping, none));
    EXPECT_TRUE(permitted(CommandId::FileRead, Capabilities{}));
    EXPECT_STREQ(required_capability(CommandId::ScreenStart), "screen_capture");
    EXPECT_EQ(required_capability(CommandId::Ping), nullptr);
}

TEST(CommandRouterTest, AnswersUnregisteredCommandsWithFailure) {
    CommandRouter router;
    EXPECT_TRUE(router.handles(CommandId::Ping));
    EXPECT_FALSE(router.handles(CommandId::ShellExecute));

    Packet command(MessageKind::Command, 7, encode_command(CommandId::ShellExecute, {}));
    auto responder = std::make_shared<networking::Responder>(std::weak_ptr<networking::Connection>(), 7);
    router.dispatch(command, responder);
    EXPECT_TRUE(responder->finished());
}

TEST(CommandRouterTest, RoutesToRegisteredHandler) {
    CommandRouter router;
    std::string seen;
    router.add(CommandId::ScreenStart, [&seen](const CommandView& view, std::shared_ptr<networking::Responder> r) {
        seen.assign(view.body, view.body + view.body_size);
        r->finish();
    });

    Packet command(MessageKind::Command, 8, encode_command(CommandId::ScreenStart, {'4', '2'}));
    auto responder = std::make_shared<networking::Responder>(std::weak_ptr<networking::Connection>(), 8);
    router(command, responder);
    EXPECT_EQ(seen, "42");
    EXPECT_TRUE(responder->finished());
}
