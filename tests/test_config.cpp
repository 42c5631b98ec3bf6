#include <gtest/gtest.h>
#include "tether/config.hpp"
#include "tether/error.hpp"

using namespace tether;
using std::chrono::milliseconds;

TEST(ConfigTest, DefaultsApplyWhenKeysAreMissing) {
    Config config = parse_config(std::string("{}"));
    EXPECT_EQ(config.connection.supported_versions, std::vector<uint32_t>{1});
    EXPECT_EQ(config.connection.heartbeat_interval, milliseconds(30000));
    EXPECT_EQ(config.connection.max_payload_size, 4u * 1024 * 1024);
    EXPECT_EQ(config.reconnect.max_attempts, 5u);
    EXPECT_EQ(config.stream.mtu, 1400u);
    EXPECT_EQ(config.transfer.chunk_size, 64u * 1024);
}

TEST(ConfigTest, OverridesAndIgnoresUnknownKeys) {
    Config config = parse_config(std::string(R"({
        "connection": {"heartbeat_interval_ms": 5000, "supported_versions": [1, 2], "whatever": true},
        "reconnect": {"enabled": false, "base_delay_ms": 100, "max_delay_ms": 800},
        "stream": {"mtu": 1200},
        "transfer": {"chunk_size": 4096}
    })"));
    EXPECT_EQ(config.connection.heartbeat_interval, milliseconds(5000));
    EXPECT_EQ(config.connection.supported_versions, (std::vector<uint32_t>{1, 2}));
    EXPECT_EQ(config.connection.peer_timeout, milliseconds(90000));
    EXPECT_FALSE(config.reconnect.enabled);
    EXPECT_EQ(config.stream.mtu, 1200u);
    EXPECT_EQ(config.stream.max_sub_chunks, 16384u);
    EXPECT_EQ(config.transfer.chunk_size, 4096u);
}

TEST(ConfigTest, PartialCapabilitiesKeepDefaults) {
    Config config = parse_config(std::string(R"({"connection": {"capabilities": {"compression": false}}})"));
    EXPECT_FALSE(config.connection.capabilities.compression);
    EXPECT_TRUE(config.connection.capabilities.shell_streaming);
    EXPECT_TRUE(config.connection.capabilities.file_delta_sync);
    EXPECT_TRUE(config.connection.capabilities.screen_capture);
    EXPECT_EQ(config.connection.capabilities.max_payload_size, protocol::kDefaultMaxPayloadSize);

    EXPECT_THROW(parse_config(std::string(R"({"connection": {"capabilities": true}})")), Error);
}

TEST(ConfigTest, SurvivesJsonRoundTrip) {
    Config config;
    config.connection.client_id = "controller";
    config.reconnect.max_attempts = 9;
    nlohmann::json j = config;
    Config back = parse_config(j);
    EXPECT_EQ(back.connection.client_id, "controller");
    EXPECT_EQ(back.reconnect.max_attempts, 9u);
}

TEST(ConfigTest, RejectsInvalidValues) {
    EXPECT_THROW(parse_config(std::string("not json")), Error);
    EXPECT_THROW(parse_config(std::string(R"({"connection": {"supported_versions": []}})")), Error);
    EXPECT_THROW(parse_config(std::string(R"({"stream": {"mtu": 8}})")), Error);
    // Room for a sub-chunk but not for the 34-byte frame header.
    EXPECT_THROW(parse_config(std::string(R"({"stream": {"mtu": 20}})")), Error);
    EXPECT_NO_THROW(parse_config(std::string(R"({"stream": {"mtu": 34}})")));
    EXPECT_THROW(parse_config(std::string(R"({"transfer": {"chunk_size": "big"}})")), Error);
}

TEST(ReconnectPolicyTest, BackoffDoublesUpToTheCap) {
    ReconnectPolicy policy;
    policy.base_delay = milliseconds(500);
    policy.max_delay = milliseconds(3000);
    EXPECT_EQ(policy.delay_for(1), milliseconds(500));
    EXPECT_EQ(policy.delay_for(2), milliseconds(1000));
    EXPECT_EQ(policy.delay_for(3), milliseconds(2000));
    EXPECT_EQ(policy.delay_for(4), milliseconds(3000));
    EXPECT_EQ(policy.delay_for(60), milliseconds(3000));
}
