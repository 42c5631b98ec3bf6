#pragma once

#include <boost/asio/buffer.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>
#include "tether/error.hpp"
#include "tether/protocol/packet.hpp"

namespace tether::protocol {

// Incremental framing over an ordered byte stream.
//
// Bytes may arrive in arbitrary pieces; next() yields complete packets
// in stream order. A parsed header is remembered while its payload is
// still arriving, so it is never re-parsed. Any integrity or framing
// failure marks the codec corrupted: the stream cannot be resynchronized
// and every later call throws.
class FrameCodec {
public:
    explicit FrameCodec(std::size_t max_payload_size = kDefaultMaxPayloadSize);

    // Header + payload bytes. Consumes the packet.
    static std::vector<uint8_t> encode(Packet&& packet);

    // Append received bytes (copying).
    void feed(const uint8_t* data, std::size_t size);

    // Zero-copy receive: read straight into prepare(n), then commit() the
    // number of bytes actually read.
    boost::asio::mutable_buffer prepare(std::size_t size);
    void commit(std::size_t size);

    // Next complete packet, or nullopt when more bytes are needed.
    // The view borrows the receive buffer until the next feed()/prepare().
    // Throws tether::Error: UnsupportedVersion, FrameTooLarge,
    // ChecksumMismatch, ProtocolViolation (after an earlier failure).
    std::optional<PacketView> next();

    // Owning variant of next().
    std::optional<Packet> decode();

    std::size_t buffered() const { return write_pos_ - read_pos_; }
    bool corrupted() const { return corrupted_; }
    std::size_t max_payload_size() const { return max_payload_size_; }

private:
    [[noreturn]] void fail(ErrorKind kind, const std::string& message);
    void compact();
    void reserve_tail(std::size_t size);

    std::vector<uint8_t> buffer_;
    std::size_t read_pos_ = 0;
    std::size_t write_pos_ = 0;
    std::optional<PacketHeader> pending_;
    std::size_t max_payload_size_;
    bool corrupted_ = false;
};

} // namespace tether::protocol
