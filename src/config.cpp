#include "tether/config.hpp"
#include <algorithm>
#include "tether/error.hpp"
#include "tether/transfer/frame_stream.hpp"

namespace tether {

namespace {

void read_ms(const nlohmann::json& j, const char* key, Milliseconds& out) {
    if (j.contains(key)) {
        out = Milliseconds(j.at(key).get<int64_t>());
    }
}

template <typename T>
void read_value(const nlohmann::json& j, const char* key, T& out) {
    if (j.contains(key)) {
        out = j.at(key).get<T>();
    }
}

// Field by field so a partial object keeps the remaining defaults.
void read_capabilities(const nlohmann::json& j, protocol::Capabilities& caps) {
    if (!j.contains("capabilities")) {
        return;
    }
    const nlohmann::json& c = j.at("capabilities");
    if (!c.is_object()) {
        throw Error(ErrorKind::Encoding, "connection.capabilities must be an object");
    }
    read_value(c, "shell_streaming", caps.shell_streaming);
    read_value(c, "file_delta_sync", caps.file_delta_sync);
    read_value(c, "screen_capture", caps.screen_capture);
    read_value(c, "compression", caps.compression);
    read_value(c, "max_payload_size", caps.max_payload_size);
}

void validate(const Config& c) {
    if (c.connection.supported_versions.empty()) {
        throw Error(ErrorKind::Encoding, "connection.supported_versions must not be empty");
    }
    if (c.connection.heartbeat_interval.count() <= 0) {
        throw Error(ErrorKind::Encoding, "connection.heartbeat_interval must be positive");
    }
    if (c.connection.sweep_interval.count() <= 0) {
        throw Error(ErrorKind::Encoding, "connection.sweep_interval must be positive");
    }
    if (c.reconnect.base_delay.count() <= 0 || c.reconnect.max_delay < c.reconnect.base_delay) {
        throw Error(ErrorKind::Encoding, "reconnect delays must satisfy 0 < base_delay <= max_delay");
    }
    if (c.stream.mtu < std::max(transfer::kSubChunkOverhead + 1, transfer::kFrameHeaderSize)) {
        throw Error(ErrorKind::Encoding, "stream.mtu too small for frame headers");
    }
    if (c.transfer.chunk_size == 0) {
        throw Error(ErrorKind::Encoding, "transfer.chunk_size must be positive");
    }
}

} // namespace

Milliseconds ReconnectPolicy::delay_for(uint32_t attempt) const {
    if (attempt <= 1) {
        return std::min(base_delay, max_delay);
    }
    Milliseconds delay = base_delay;
    for (uint32_t i = 1; i < attempt; ++i) {
        delay *= 2;
        if (delay >= max_delay) {
            return max_delay;
        }
    }
    return delay;
}

void to_json(nlohmann::json& j, const ConnectionConfig& c) {
    j = nlohmann::json{
        {"client_id", c.client_id},
        {"supported_versions", c.supported_versions},
        {"capabilities", c.capabilities},
        {"heartbeat_interval_ms", c.heartbeat_interval.count()},
        {"peer_timeout_ms", c.peer_timeout.count()},
        {"handshake_timeout_ms", c.handshake_timeout.count()},
        {"request_timeout_ms", c.request_timeout.count()},
        {"drain_timeout_ms", c.drain_timeout.count()},
        {"sweep_interval_ms", c.sweep_interval.count()},
        {"max_payload_size", c.max_payload_size},
        {"compression_threshold", c.compression_threshold},
        {"write_high_water", c.write_high_water},
    };
}

void from_json(const nlohmann::json& j, ConnectionConfig& c) {
    read_value(j, "client_id", c.client_id);
    read_value(j, "supported_versions", c.supported_versions);
    read_capabilities(j, c.capabilities);
    read_ms(j, "heartbeat_interval_ms", c.heartbeat_interval);
    read_ms(j, "peer_timeout_ms", c.peer_timeout);
    read_ms(j, "handshake_timeout_ms", c.handshake_timeout);
    read_ms(j, "request_timeout_ms", c.request_timeout);
    read_ms(j, "drain_timeout_ms", c.drain_timeout);
    read_ms(j, "sweep_interval_ms", c.sweep_interval);
    read_value(j, "max_payload_size", c.max_payload_size);
    read_value(j, "compression_threshold", c.compression_threshold);
    read_value(j, "write_high_water", c.write_high_water);
}

void to_json(nlohmann::json& j, const ReconnectPolicy& r) {
    j = nlohmann::json{
        {"enabled", r.enabled},
        {"max_attempts", r.max_attempts},
        {"base_delay_ms", r.base_delay.count()},
        {"max_delay_ms", r.max_delay.count()},
        {"connect_timeout_ms", r.connect_timeout.count()},
    };
}

void from_json(const nlohmann::json& j, ReconnectPolicy& r) {
    read_value(j, "enabled", r.enabled);
    read_value(j, "max_attempts", r.max_attempts);
    read_ms(j, "base_delay_ms", r.base_delay);
    read_ms(j, "max_delay_ms", r.max_delay);
    read_ms(j, "connect_timeout_ms", r.connect_timeout);
}

void to_json(nlohmann::json& j, const StreamConfig& s) {
    j = nlohmann::json{
        {"mtu", s.mtu},
        {"max_sub_chunks", s.max_sub_chunks},
    };
}

void from_json(const nlohmann::json& j, StreamConfig& s) {
    read_value(j, "mtu", s.mtu);
    read_value(j, "max_sub_chunks", s.max_sub_chunks);
}

void to_json(nlohmann::json& j, const TransferConfig& t) {
    j = nlohmann::json{{"chunk_size", t.chunk_size}};
}

void from_json(const nlohmann::json& j, TransferConfig& t) {
    read_value(j, "chunk_size", t.chunk_size);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"connection", c.connection},
        {"reconnect", c.reconnect},
        {"stream", c.stream},
        {"transfer", c.transfer},
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    read_value(j, "connection", c.connection);
    read_value(j, "reconnect", c.reconnect);
    read_value(j, "stream", c.stream);
    read_value(j, "transfer", c.transfer);
}

Config parse_config(const nlohmann::json& document) {
    Config config;
    try {
        config = document.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        throw Error(ErrorKind::Encoding, std::string("invalid configuration: ") + e.what());
    }
    validate(config);
    return config;
}

Config parse_config(const std::string& text) {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        throw Error(ErrorKind::Encoding, std::string("configuration is not valid JSON: ") + e.what());
    }
    return parse_config(document);
}

} // namespace tether
