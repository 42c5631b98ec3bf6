#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>
#include "tether/security.hpp"

namespace tether::protocol {

// "TTH" protocol family followed by the ASCII major version.
constexpr std::array<uint8_t, 4> kMagic = {'T', 'T', 'H', '1'};
constexpr uint32_t kProtocolVersion = 1;

// Fixed 72-byte header, little-endian:
//   0  magic(4)  4 digest(32)  36 kind(4)  40 flags(8)
//  48 correlation_id(8)  56 payload_length(8)  64 version(4)  68 reserved(4)
constexpr std::size_t kHeaderSize = 72;
constexpr std::size_t kDefaultMaxPayloadSize = 4 * 1024 * 1024;

enum class MessageKind : uint32_t {
    Unknown = 0,
    Command = 1,
    Response = 2,
    Hello = 3,
    Heartbeat = 4,
    Goodbye = 5,
    Cancel = 6
};

MessageKind message_kind_from_wire(uint32_t value);
const char* to_string(MessageKind kind);

using Flags = uint64_t;

namespace flags {
constexpr Flags kNone        = 0;
constexpr Flags kCompressed  = 1ull << 0;
constexpr Flags kChunked     = 1ull << 1;
constexpr Flags kLastChunk   = 1ull << 2;
constexpr Flags kAckRequired = 1ull << 3;
constexpr Flags kStreaming   = 1ull << 4;
constexpr Flags kError       = 1ull << 5;
} // namespace flags

struct PacketHeader {
    std::array<uint8_t, 4> magic = kMagic;
    security::Digest digest{};
    uint32_t kind = 0; // raw wire value, see message_kind()
    Flags flags = flags::kNone;
    uint64_t correlation_id = 0;
    uint64_t payload_length = 0;
    uint32_t protocol_version = kProtocolVersion;

    MessageKind message_kind() const { return message_kind_from_wire(kind); }
    bool has_flag(Flags flag) const { return (flags & flag) == flag; }
};

bool operator==(const PacketHeader& a, const PacketHeader& b);
inline bool operator!=(const PacketHeader& a, const PacketHeader& b) { return !(a == b); }

using HeaderBytes = std::array<uint8_t, kHeaderSize>;

HeaderBytes serialize_header(const PacketHeader& header);

// Raw field extraction from kHeaderSize bytes; performs no validation.
PacketHeader deserialize_header(const uint8_t* data);

// Throws tether::Error(UnsupportedVersion) for a foreign magic or a major
// version this build does not speak.
void validate_magic(const PacketHeader& header);

// Header + owned payload. Move-only: a packet has exactly one owner, and
// FrameCodec::encode consumes it.
class Packet {
public:
    Packet() = default;

    // Builds a fresh outbound packet and computes the payload digest.
    Packet(MessageKind kind, uint64_t correlation_id, std::vector<uint8_t> payload,
           Flags flags = flags::kNone, uint32_t protocol_version = kProtocolVersion);

    // Wraps a received header and payload whose digest was already checked.
    Packet(const PacketHeader& header, std::vector<uint8_t> payload);

    Packet(Packet&&) noexcept = default;
    Packet& operator=(Packet&&) noexcept = default;
    Packet(const Packet&) = delete;
    Packet& operator=(const Packet&) = delete;

    Packet clone() const;

    const PacketHeader& header() const { return header_; }
    MessageKind kind() const { return header_.message_kind(); }
    Flags flags() const { return header_.flags; }
    bool has_flag(Flags flag) const { return header_.has_flag(flag); }
    uint64_t correlation_id() const { return header_.correlation_id; }
    uint32_t protocol_version() const { return header_.protocol_version; }

    const std::vector<uint8_t>& payload() const { return payload_; }
    std::vector<uint8_t> take_payload();

    // Responses are terminal unless they are streaming fragments without
    // the last-chunk marker.
    bool is_terminal() const;

    bool verify_digest() const;

private:
    PacketHeader header_;
    std::vector<uint8_t> payload_;
};

// A decoded packet whose payload still lives in the codec's receive buffer.
// Valid until the next call into the codec that produced it.
struct PacketView {
    PacketHeader header;
    const uint8_t* payload = nullptr;
    std::size_t payload_size = 0;

    MessageKind kind() const { return header.message_kind(); }

    // Copies the payload out of the receive buffer.
    Packet to_owned() const;
};

} // namespace tether::protocol
