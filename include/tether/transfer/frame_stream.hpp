#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <vector>
#include "tether/config.hpp"

namespace tether::transfer {

// One encoded screen image. The codec producing data is the capture
// provider's business; the stream only moves bytes.
struct EncodedFrame {
    uint32_t sequence = 0; // assigned by FrameSplitter
    uint64_t frame_id = 0;
    uint64_t timestamp_ms = 0;
    uint32_t width = 0;
    uint32_t height = 0;
    bool full_frame = false;
    std::vector<uint8_t> data;
};

// Datagram layouts, little-endian, each led by a one-byte tag:
//   frame header: tag(1) seq(4) frame_id(8) timestamp(8) width(4) height(4)
//                 full_frame(1) sub_chunk_count(4)
//   sub-chunk:    tag(1) seq(4) index(4) length(4) bytes
constexpr uint8_t kFrameHeaderTag = 0x01;
constexpr uint8_t kSubChunkTag = 0x02;
constexpr std::size_t kFrameHeaderSize = 34;
constexpr std::size_t kSubChunkOverhead = 13;

// Serial-number order on the 32-bit sequence space: true when a
// precedes b, across wraparound.
inline bool sequence_before(uint32_t a, uint32_t b) {
    return static_cast<int32_t>(a - b) < 0;
}

class FrameSplitter {
public:
    explicit FrameSplitter(const StreamConfig& config = {}, uint32_t first_sequence = 0);

    // Assigns frame.sequence and returns the datagrams to send: the frame
    // header first, then the sub-chunks in order.
    // Throws tether::Error(FrameTooLarge) past max_sub_chunks.
    std::vector<std::vector<uint8_t>> split(EncodedFrame& frame);

    uint32_t next_sequence() const { return next_sequence_; }

private:
    StreamConfig config_;
    uint32_t next_sequence_;
};

struct ReassemblyStats {
    uint64_t delivered = 0;
    uint64_t stale = 0;     // datagrams for a delivered or superseded sequence
    uint64_t discarded = 0; // incomplete frames dropped for newer ones
    uint64_t malformed = 0;
};

// Latest-wins reassembly over an unordered, lossy datagram channel.
// Only the newest sequence seen is assembled; its header may arrive after
// its sub-chunks. The first datagram of a newer sequence discards the
// pending frame, and datagrams for older sequences are dropped on arrival.
class FrameReassembler {
public:
    explicit FrameReassembler(const StreamConfig& config = {});

    // Feeds one datagram; returns the frame it completed, if any.
    // Malformed datagrams are counted and ignored.
    std::optional<EncodedFrame> push(const uint8_t* data, std::size_t size);

    const ReassemblyStats& stats() const { return stats_; }
    std::size_t pending_frames() const { return pending_ ? 1 : 0; }
    std::optional<uint32_t> newest_sequence() const { return newest_; }
    std::optional<uint32_t> last_delivered() const { return last_delivered_; }

private:
    struct Assembly {
        uint32_t sequence = 0;
        bool have_header = false;
        EncodedFrame frame;
        uint32_t total = 0;
        std::map<uint32_t, std::vector<uint8_t>> chunks;
    };

    // The assembly for sequence, or null when the datagram is stale.
    Assembly* admit(uint32_t sequence);
    std::optional<EncodedFrame> complete_if_ready();

    StreamConfig config_;
    std::optional<Assembly> pending_;
    std::optional<uint32_t> newest_;
    std::optional<uint32_t> last_delivered_;
    ReassemblyStats stats_;
};

} // namespace tether::transfer
