#include "tether/transfer/delta.hpp"
#include "tether/error.hpp"
#include <boost/endian/conversion.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace tether::transfer {

void to_json(nlohmann::json& j, const ChunkInfo& chunk) {
    j = nlohmann::json{{"offset", chunk.offset}, {"length", chunk.length}, {"hash", security::to_hex(chunk.hash)}};
}

void from_json(const nlohmann::json& j, ChunkInfo& chunk) {
    j.at("offset").get_to(chunk.offset);
    j.at("length").get_to(chunk.length);
    chunk.hash = security::digest_from_hex(j.at("hash").get<std::string>());
}

ChunkSet compute_chunk_set(const uint8_t* data, std::size_t size, uint32_t chunk_size) {
    if (chunk_size == 0) {
        throw Error(ErrorKind::Encoding, "chunk size must be positive");
    }
    ChunkSet chunks;
    chunks.reserve(size / chunk_size + 1);
    for (std::size_t offset = 0; offset < size; offset += chunk_size) {
        const auto length = static_cast<uint32_t>(std::min<std::size_t>(chunk_size, size - offset));
        chunks.push_back({offset, length, security::hash(data + offset, length)});
    }
    return chunks;
}

ChunkSet compute_chunk_set(const std::vector<uint8_t>& data, uint32_t chunk_size) {
    return compute_chunk_set(data.data(), data.size(), chunk_size);
}

ChunkSet compute_chunk_set_from_file(const std::string& path, uint32_t chunk_size) {
    if (chunk_size == 0) {
        throw Error(ErrorKind::Encoding, "chunk size must be positive");
    }
    ChunkSet chunks;
    if (!std::filesystem::exists(path)) {
        return chunks;
    }
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file for reading: " + path);
    }

    std::vector<char> buffer(chunk_size);
    uint64_t offset = 0;
    while (file.read(buffer.data(), buffer.size()) || file.gcount() > 0) {
        const auto length = static_cast<uint32_t>(file.gcount());
        chunks.push_back({offset, length, security::hash(buffer.data(), length)});
        offset += length;
    }
    return chunks;
}

std::vector<uint8_t> encode_op(const DeltaOp& op) {
    const bool write = op.type == DeltaOpType::Write;
    std::vector<uint8_t> out(kDeltaOpHeaderSize + (write ? op.data.size() : 0));
    out[0] = static_cast<uint8_t>(op.type);
    boost::endian::store_little_u64(out.data() + 1, op.dest_offset);
    boost::endian::store_little_u64(out.data() + 9, op.source_offset);
    boost::endian::store_little_u32(out.data() + 17, op.length);
    if (write) {
        std::copy(op.data.begin(), op.data.end(), out.begin() + kDeltaOpHeaderSize);
    }
    return out;
}

DeltaOp decode_op(const uint8_t* data, std::size_t size) {
    if (size < kDeltaOpHeaderSize) {
        throw Error(ErrorKind::Encoding, "delta op shorter than its header");
    }
    DeltaOp op;
    switch (data[0]) {
        case static_cast<uint8_t>(DeltaOpType::Write): op.type = DeltaOpType::Write; break;
        case static_cast<uint8_t>(DeltaOpType::Copy):  op.type = DeltaOpType::Copy; break;
        default:
            throw Error(ErrorKind::Encoding, "unknown delta op type " + std::to_string(data[0]));
    }
    op.dest_offset = boost::endian::load_little_u64(data + 1);
    op.source_offset = boost::endian::load_little_u64(data + 9);
    op.length = boost::endian::load_little_u32(data + 17);

    const std::size_t body = size - kDeltaOpHeaderSize;
    if (op.type == DeltaOpType::Write) {
        if (body != op.length) {
            throw Error(ErrorKind::Encoding, "write op announces " + std::to_string(op.length) +
                                             " bytes but carries " + std::to_string(body));
        }
        op.data.assign(data + kDeltaOpHeaderSize, data + size);
    } else if (body != 0) {
        throw Error(ErrorKind::Encoding, "copy op carries trailing data");
    }
    return op;
}

ChunkIndex::ChunkIndex(const ChunkSet& inventory) {
    for (const auto& chunk : inventory) {
        // First occurrence wins; any copy of identical content will do.
        by_hash_.emplace(chunk.hash, chunk);
    }
}

const ChunkInfo* ChunkIndex::find(const security::Digest& hash, uint32_t length) const {
    auto it = by_hash_.find(hash);
    if (it == by_hash_.end() || it->second.length != length) {
        return nullptr;
    }
    return &it->second;
}

DeltaOp ChunkIndex::make_op(uint64_t offset, const uint8_t* block, uint32_t length) const {
    DeltaOp op;
    op.dest_offset = offset;
    op.length = length;
    if (const ChunkInfo* known = find(security::hash(block, length), length)) {
        op.type = DeltaOpType::Copy;
        op.source_offset = known->offset;
    } else {
        op.type = DeltaOpType::Write;
        op.data.assign(block, block + length);
    }
    return op;
}

std::vector<DeltaOp> make_delta(const uint8_t* data, std::size_t size, uint32_t chunk_size,
                                const ChunkSet& inventory) {
    if (chunk_size == 0) {
        throw Error(ErrorKind::Encoding, "chunk size must be positive");
    }
    ChunkIndex index(inventory);
    std::vector<DeltaOp> ops;
    for (std::size_t offset = 0; offset < size; offset += chunk_size) {
        const auto length = static_cast<uint32_t>(std::min<std::size_t>(chunk_size, size - offset));
        ops.push_back(index.make_op(offset, data + offset, length));
    }
    return ops;
}

std::vector<DeltaOp> make_delta(const std::vector<uint8_t>& data, uint32_t chunk_size, const ChunkSet& inventory) {
    return make_delta(data.data(), data.size(), chunk_size, inventory);
}

std::vector<uint8_t> apply_delta(const std::vector<DeltaOp>& ops, const std::vector<uint8_t>& base) {
    std::vector<uint8_t> out;
    for (const auto& op : ops) {
        const uint64_t end = op.dest_offset + op.length;
        if (out.size() < end) {
            out.resize(static_cast<std::size_t>(end));
        }
        if (op.type == DeltaOpType::Write) {
            std::copy(op.data.begin(), op.data.end(), out.begin() + static_cast<std::ptrdiff_t>(op.dest_offset));
            continue;
        }
        if (op.source_offset + op.length > base.size()) {
            throw Error(ErrorKind::Encoding, "copy op reaches past the end of the prior version");
        }
        std::copy_n(base.begin() + static_cast<std::ptrdiff_t>(op.source_offset), op.length,
                    out.begin() + static_cast<std::ptrdiff_t>(op.dest_offset));
    }
    return out;
}

} // namespace tether::transfer
