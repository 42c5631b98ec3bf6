#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "tether/protocol/packet.hpp"

namespace tether::protocol {

struct Capabilities {
    bool shell_streaming = true;
    bool file_delta_sync = true;
    bool screen_capture = true;
    bool compression = true;
    uint64_t max_payload_size = kDefaultMaxPayloadSize;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Capabilities, shell_streaming, file_delta_sync, screen_capture,
                                   compression, max_payload_size)

// Intersection of both peers: features both support, smaller payload cap.
Capabilities negotiate(const Capabilities& local, const Capabilities& remote);

// Payload of a Hello packet. The initiator's Hello opens the handshake;
// the receiver answers with its own Hello carrying accepted/selected_version.
struct Hello {
    std::string client_id;
    std::vector<uint32_t> versions;
    Capabilities capabilities;
    uint64_t timestamp_ms = 0;
    bool accepted = true;
    uint32_t selected_version = 0;
    std::string reason;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Hello, client_id, versions, capabilities, timestamp_ms,
                                   accepted, selected_version, reason)

// Highest version present in both lists.
std::optional<uint32_t> negotiate_version(const std::vector<uint32_t>& local,
                                          const std::vector<uint32_t>& remote);

std::vector<uint8_t> encode_hello(const Hello& hello);

// Throws tether::Error(Encoding) on malformed JSON or missing fields.
Hello decode_hello(const uint8_t* data, std::size_t size);

} // namespace tether::protocol
