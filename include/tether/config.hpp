#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "tether/protocol/hello.hpp"

namespace tether {

using Milliseconds = std::chrono::milliseconds;

struct ConnectionConfig {
    std::string client_id;                         // empty: generated at connection start
    std::vector<uint32_t> supported_versions{protocol::kProtocolVersion};
    protocol::Capabilities capabilities;
    Milliseconds heartbeat_interval{30000};
    Milliseconds peer_timeout{90000};              // 0 disables the liveness check
    Milliseconds handshake_timeout{10000};
    Milliseconds request_timeout{0};               // 0: requests have no deadline by default
    Milliseconds drain_timeout{10000};
    Milliseconds sweep_interval{250};
    std::size_t max_payload_size = protocol::kDefaultMaxPayloadSize;
    std::size_t compression_threshold = 4096;      // 0 disables compression on send
    std::size_t write_high_water = 8 * 1024 * 1024; // 0: response fragments never wait
};

struct ReconnectPolicy {
    bool enabled = true;
    uint32_t max_attempts = 5;
    Milliseconds base_delay{500};
    Milliseconds max_delay{30000};
    Milliseconds connect_timeout{5000};

    // min(base_delay * 2^(attempt-1), max_delay); attempt counts from 1.
    Milliseconds delay_for(uint32_t attempt) const;
};

struct StreamConfig {
    std::size_t mtu = 1400;
    uint32_t max_sub_chunks = 16384;
};

struct TransferConfig {
    uint32_t chunk_size = 64 * 1024;
};

struct Config {
    ConnectionConfig connection;
    ReconnectPolicy reconnect;
    StreamConfig stream;
    TransferConfig transfer;
};

// Missing keys keep their defaults; durations are integer milliseconds.
void to_json(nlohmann::json& j, const ConnectionConfig& c);
void from_json(const nlohmann::json& j, ConnectionConfig& c);
void to_json(nlohmann::json& j, const ReconnectPolicy& r);
void from_json(const nlohmann::json& j, ReconnectPolicy& r);
void to_json(nlohmann::json& j, const StreamConfig& s);
void from_json(const nlohmann::json& j, StreamConfig& s);
void to_json(nlohmann::json& j, const TransferConfig& t);
void from_json(const nlohmann::json& j, TransferConfig& t);
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

// Parses and validates a configuration document.
// Throws tether::Error(Encoding) on type errors or out-of-range values.
Config parse_config(const nlohmann::json& document);
Config parse_config(const std::string& text);

} // namespace tether
