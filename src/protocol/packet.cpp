#include "tether/protocol/packet.hpp"
#include "tether/error.hpp"
#include <algorithm>
#include <boost/endian/conversion.hpp>
#include <cstring>
#include <string>

namespace tether::protocol {

MessageKind message_kind_from_wire(uint32_t value) {
    switch (value) {
        case 1: return MessageKind::Command;
        case 2: return MessageKind::Response;
        case 3: return MessageKind::Hello;
        case 4: return MessageKind::Heartbeat;
        case 5: return MessageKind::Goodbye;
        case 6: return MessageKind::Cancel;
        default: return MessageKind::Unknown;
    }
}

const char* to_string(MessageKind kind) {
    switch (kind) {
        case MessageKind::Command:   return "Command";
        case MessageKind::Response:  return "Response";
        case MessageKind::Hello:     return "Hello";
        case MessageKind::Heartbeat: return "Heartbeat";
        case MessageKind::Goodbye:   return "Goodbye";
        case MessageKind::Cancel:    return "Cancel";
        case MessageKind::Unknown:   break;
    }
    return "Unknown";
}

bool operator==(const PacketHeader& a, const PacketHeader& b) {
    return a.magic == b.magic && a.digest == b.digest && a.kind == b.kind && a.flags == b.flags &&
           a.correlation_id == b.correlation_id && a.payload_length == b.payload_length &&
           a.protocol_version == b.protocol_version;
}

HeaderBytes serialize_header(const PacketHeader& header) {
    HeaderBytes buffer{};
    std::memcpy(buffer.data(), header.magic.data(), 4);
    std::memcpy(buffer.data() + 4, header.digest.data(), security::kDigestSize);
    boost::endian::store_little_u32(buffer.data() + 36, header.kind);
    boost::endian::store_little_u64(buffer.data() + 40, header.flags);
    boost::endian::store_little_u64(buffer.data() + 48, header.correlation_id);
    boost::endian::store_little_u64(buffer.data() + 56, header.payload_length);
    boost::endian::store_little_u32(buffer.data() + 64, header.protocol_version);
    // bytes 68..71 stay zero (reserved)
    return buffer;
}

PacketHeader deserialize_header(const uint8_t* data) {
    PacketHeader header;
    std::memcpy(header.magic.data(), data, 4);
    std::memcpy(header.digest.data(), data + 4, security::kDigestSize);
    header.kind = boost::endian::load_little_u32(data + 36);
    header.flags = boost::endian::load_little_u64(data + 40);
    header.correlation_id = boost::endian::load_little_u64(data + 48);
    header.payload_length = boost::endian::load_little_u64(data + 56);
    header.protocol_version = boost::endian::load_little_u32(data + 64);
    return header;
}

void validate_magic(const PacketHeader& header) {
    if (!std::equal(kMagic.begin(), kMagic.begin() + 3, header.magic.begin())) {
        throw Error(ErrorKind::UnsupportedVersion, "unrecognized protocol magic");
    }
    if (header.magic[3] != kMagic[3]) {
        throw Error(ErrorKind::UnsupportedVersion,
                    std::string("unsupported protocol major version '") + static_cast<char>(header.magic[3]) + "'");
    }
}

Packet::Packet(MessageKind kind, uint64_t correlation_id, std::vector<uint8_t> payload,
               Flags flags, uint32_t protocol_version)
    : payload_(std::move(payload)) {
    header_.kind = static_cast<uint32_t>(kind);
    header_.flags = flags;
    header_.correlation_id = correlation_id;
    header_.payload_length = payload_.size();
    header_.protocol_version = protocol_version;
    header_.digest = security::hash(payload_);
}

Packet::Packet(const PacketHeader& header, std::vector<uint8_t> payload)
    : header_(header), payload_(std::move(payload)) {}

Packet Packet::clone() const {
    return Packet(header_, payload_);
}

std::vector<uint8_t> Packet::take_payload() {
    std::vector<uint8_t> out = std::move(payload_);
    payload_.clear();
    return out;
}

bool Packet::is_terminal() const {
    return !(has_flag(flags::kStreaming) && !has_flag(flags::kLastChunk));
}

bool Packet::verify_digest() const {
    return header_.payload_length == payload_.size() &&
           security::digest_equal(security::hash(payload_), header_.digest);
}

Packet PacketView::to_owned() const {
    return Packet(header, std::vector<uint8_t>(payload, payload + payload_size));
}

} // namespace tether::protocol
