#include "tether/transfer/frame_stream.hpp"
#include "tether/error.hpp"
#include "tether/log.hpp"
#include <boost/endian/conversion.hpp>
#include <algorithm>

namespace tether::transfer {

namespace {

std::size_t chunk_capacity(const StreamConfig& config) {
    return config.mtu - kSubChunkOverhead;
}

} // namespace

FrameSplitter::FrameSplitter(const StreamConfig& config, uint32_t first_sequence)
    : config_(config), next_sequence_(first_sequence) {
    if (config_.mtu <= kSubChunkOverhead || config_.mtu < kFrameHeaderSize) {
        throw Error(ErrorKind::Encoding, "mtu " + std::to_string(config_.mtu) + " too small for stream datagrams");
    }
}

std::vector<std::vector<uint8_t>> FrameSplitter::split(EncodedFrame& frame) {
    const std::size_t capacity = chunk_capacity(config_);
    const std::size_t count = (frame.data.size() + capacity - 1) / capacity;
    if (count > config_.max_sub_chunks) {
        throw Error(ErrorKind::FrameTooLarge, "frame of " + std::to_string(frame.data.size()) + " bytes needs " +
                                              std::to_string(count) + " sub-chunks");
    }

    frame.sequence = next_sequence_++;

    std::vector<std::vector<uint8_t>> datagrams;
    datagrams.reserve(count + 1);

    std::vector<uint8_t> header(kFrameHeaderSize);
    header[0] = kFrameHeaderTag;
    boost::endian::store_little_u32(header.data() + 1, frame.sequence);
    boost::endian::store_little_u64(header.data() + 5, frame.frame_id);
    boost::endian::store_little_u64(header.data() + 13, frame.timestamp_ms);
    boost::endian::store_little_u32(header.data() + 21, frame.width);
    boost::endian::store_little_u32(header.data() + 25, frame.height);
    header[29] = frame.full_frame ? 1 : 0;
    boost::endian::store_little_u32(header.data() + 30, static_cast<uint32_t>(count));
    datagrams.push_back(std::move(header));

    for (std::size_t i = 0; i < count; ++i) {
        const std::size_t offset = i * capacity;
        const std::size_t length = std::min(capacity, frame.data.size() - offset);
        std::vector<uint8_t> chunk(kSubChunkOverhead + length);
        chunk[0] = kSubChunkTag;
        boost::endian::store_little_u32(chunk.data() + 1, frame.sequence);
        boost::endian::store_little_u32(chunk.data() + 5, static_cast<uint32_t>(i));
        boost::endian::store_little_u32(chunk.data() + 9, static_cast<uint32_t>(length));
        std::copy_n(frame.data.begin() + static_cast<std::ptrdiff_t>(offset), length,
                    chunk.begin() + kSubChunkOverhead);
        datagrams.push_back(std::move(chunk));
    }
    return datagrams;
}

FrameReassembler::FrameReassembler(const StreamConfig& config) : config_(config) {}

FrameReassembler::Assembly* FrameReassembler::admit(uint32_t sequence) {
    const bool delivered = last_delivered_ && !sequence_before(*last_delivered_, sequence);
    if (delivered || (newest_ && sequence_before(sequence, *newest_))) {
        ++stats_.stale;
        return nullptr;
    }
    if (!newest_ || sequence_before(*newest_, sequence)) {
        if (pending_) {
            log::debug("stream", "discarding frame " + std::to_string(pending_->sequence) + ", superseded by " +
                                 std::to_string(sequence));
            ++stats_.discarded;
            pending_.reset();
        }
        newest_ = sequence;
    }
    if (!pending_) {
        pending_.emplace();
        pending_->sequence = sequence;
    }
    return &*pending_;
}

std::optional<EncodedFrame> FrameReassembler::push(const uint8_t* data, std::size_t size) {
    if (size == 0) {
        ++stats_.malformed;
        return std::nullopt;
    }

    if (data[0] == kFrameHeaderTag) {
        if (size != kFrameHeaderSize) {
            ++stats_.malformed;
            return std::nullopt;
        }
        const uint32_t sequence = boost::endian::load_little_u32(data + 1);
        const uint32_t total = boost::endian::load_little_u32(data + 30);
        if (total > config_.max_sub_chunks) {
            ++stats_.malformed;
            return std::nullopt;
        }
        Assembly* assembly = admit(sequence);
        if (!assembly || assembly->have_header) {
            return std::nullopt;
        }
        // Sub-chunks that arrived first must fit the announced count.
        if (!assembly->chunks.empty() && assembly->chunks.rbegin()->first >= total) {
            pending_.reset();
            ++stats_.malformed;
            return std::nullopt;
        }
        assembly->have_header = true;
        assembly->total = total;
        assembly->frame.sequence = sequence;
        assembly->frame.frame_id = boost::endian::load_little_u64(data + 5);
        assembly->frame.timestamp_ms = boost::endian::load_little_u64(data + 13);
        assembly->frame.width = boost::endian::load_little_u32(data + 21);
        assembly->frame.height = boost::endian::load_little_u32(data + 25);
        assembly->frame.full_frame = data[29] != 0;
        return complete_if_ready();
    }

    if (data[0] == kSubChunkTag) {
        if (size < kSubChunkOverhead) {
            ++stats_.malformed;
            return std::nullopt;
        }
        const uint32_t sequence = boost::endian::load_little_u32(data + 1);
        const uint32_t index = boost::endian::load_little_u32(data + 5);
        const uint32_t length = boost::endian::load_little_u32(data + 9);
        if (length != size - kSubChunkOverhead || index >= config_.max_sub_chunks) {
            ++stats_.malformed;
            return std::nullopt;
        }
        Assembly* assembly = admit(sequence);
        if (!assembly) {
            return std::nullopt;
        }
        if (assembly->have_header && index >= assembly->total) {
            ++stats_.malformed;
            return std::nullopt;
        }
        assembly->chunks.emplace(index, std::vector<uint8_t>(data + kSubChunkOverhead, data + size));
        return complete_if_ready();
    }

    ++stats_.malformed;
    return std::nullopt;
}

std::optional<EncodedFrame> FrameReassembler::complete_if_ready() {
    if (!pending_->have_header || pending_->chunks.size() != pending_->total) {
        return std::nullopt;
    }

    EncodedFrame frame = std::move(pending_->frame);
    for (auto& chunk : pending_->chunks) {
        frame.data.insert(frame.data.end(), chunk.second.begin(), chunk.second.end());
    }
    last_delivered_ = pending_->sequence;
    pending_.reset();
    ++stats_.delivered;
    return frame;
}

} // namespace tether::transfer
