#include "tether/protocol/codec.hpp"
#include <algorithm>
#include <cstring>
#include <string>

namespace tether::protocol {

namespace {

constexpr std::size_t kInitialBufferSize = 64 * 1024;

} // namespace

FrameCodec::FrameCodec(std::size_t max_payload_size)
    : buffer_(kInitialBufferSize), max_payload_size_(max_payload_size) {}

std::vector<uint8_t> FrameCodec::encode(Packet&& packet) {
    Packet consumed = std::move(packet);
    HeaderBytes header = serialize_header(consumed.header());

    std::vector<uint8_t> out;
    out.reserve(kHeaderSize + consumed.payload().size());
    out.insert(out.end(), header.begin(), header.end());
    out.insert(out.end(), consumed.payload().begin(), consumed.payload().end());
    return out;
}

void FrameCodec::feed(const uint8_t* data, std::size_t size) {
    auto space = prepare(size);
    std::memcpy(space.data(), data, size);
    commit(size);
}

boost::asio::mutable_buffer FrameCodec::prepare(std::size_t size) {
    reserve_tail(size);
    return boost::asio::buffer(buffer_.data() + write_pos_, size);
}

void FrameCodec::commit(std::size_t size) {
    write_pos_ += size;
    if (write_pos_ > buffer_.size()) {
        write_pos_ = buffer_.size();
    }
}

std::optional<PacketView> FrameCodec::next() {
    if (corrupted_) {
        throw Error(ErrorKind::ProtocolViolation, "stream already failed validation");
    }

    const std::size_t available = write_pos_ - read_pos_;

    if (!pending_) {
        if (available < kHeaderSize) {
            return std::nullopt;
        }
        PacketHeader header = deserialize_header(buffer_.data() + read_pos_);
        try {
            validate_magic(header);
        } catch (const Error&) {
            corrupted_ = true;
            throw;
        }
        if (header.payload_length > max_payload_size_) {
            fail(ErrorKind::FrameTooLarge, "payload length " + std::to_string(header.payload_length) +
                                           " exceeds limit " + std::to_string(max_payload_size_));
        }
        pending_ = header;
    }

    const std::size_t payload_size = static_cast<std::size_t>(pending_->payload_length);
    if (available < kHeaderSize + payload_size) {
        return std::nullopt;
    }

    const uint8_t* payload = buffer_.data() + read_pos_ + kHeaderSize;
    if (!security::digest_equal(security::hash(payload, payload_size), pending_->digest)) {
        fail(ErrorKind::ChecksumMismatch, "payload digest does not match header for correlation id " +
                                          std::to_string(pending_->correlation_id));
    }

    PacketView view{*pending_, payload, payload_size};
    read_pos_ += kHeaderSize + payload_size;
    pending_.reset();
    return view;
}

std::optional<Packet> FrameCodec::decode() {
    auto view = next();
    if (!view) {
        return std::nullopt;
    }
    return view->to_owned();
}

void FrameCodec::fail(ErrorKind kind, const std::string& message) {
    corrupted_ = true;
    throw Error(kind, message);
}

void FrameCodec::compact() {
    if (read_pos_ == 0) {
        return;
    }
    const std::size_t remaining = write_pos_ - read_pos_;
    if (remaining > 0) {
        std::memmove(buffer_.data(), buffer_.data() + read_pos_, remaining);
    }
    read_pos_ = 0;
    write_pos_ = remaining;
}

void FrameCodec::reserve_tail(std::size_t size) {
    compact();

    std::size_t wanted = write_pos_ + size;
    // A known pending frame gets its whole extent reserved at once.
    if (pending_) {
        wanted = std::max(wanted, kHeaderSize + static_cast<std::size_t>(pending_->payload_length));
    }
    if (buffer_.size() < wanted) {
        buffer_.resize(std::max(wanted, buffer_.size() * 2));
    }
}

} // namespace tether::protocol
