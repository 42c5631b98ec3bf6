#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "tether/security.hpp"

namespace tether::transfer {

// One fixed-size block of a file, addressed by content.
struct ChunkInfo {
    uint64_t offset = 0;
    uint32_t length = 0;
    security::Digest hash{};
};

using ChunkSet = std::vector<ChunkInfo>;

// Hashes are carried as lowercase hex.
void to_json(nlohmann::json& j, const ChunkInfo& chunk);
void from_json(const nlohmann::json& j, ChunkInfo& chunk);

ChunkSet compute_chunk_set(const uint8_t* data, std::size_t size, uint32_t chunk_size);
ChunkSet compute_chunk_set(const std::vector<uint8_t>& data, uint32_t chunk_size);

// Streams the file; an absent file yields an empty set.
// Throws std::runtime_error when the file exists but cannot be read.
ChunkSet compute_chunk_set_from_file(const std::string& path, uint32_t chunk_size);

enum class DeltaOpType : uint8_t {
    Write = 1, // literal bytes
    Copy = 2   // bytes already present in the receiver's prior version
};

struct DeltaOp {
    DeltaOpType type = DeltaOpType::Write;
    uint64_t dest_offset = 0;
    uint64_t source_offset = 0; // Copy only
    uint32_t length = 0;
    std::vector<uint8_t> data;  // Write only
};

// type(1) dest(8) source(8) length(4), then the data of a Write.
constexpr std::size_t kDeltaOpHeaderSize = 21;

std::vector<uint8_t> encode_op(const DeltaOp& op);

// Throws tether::Error(Encoding) on a truncated or inconsistent op.
DeltaOp decode_op(const uint8_t* data, std::size_t size);

// Lookup from content hash to a chunk the receiver already has.
class ChunkIndex {
public:
    explicit ChunkIndex(const ChunkSet& inventory);

    // Match of the same hash and length, or nullptr.
    const ChunkInfo* find(const security::Digest& hash, uint32_t length) const;

    // Copy when the block is known to the receiver, otherwise Write.
    DeltaOp make_op(uint64_t offset, const uint8_t* block, uint32_t length) const;

private:
    std::map<security::Digest, ChunkInfo> by_hash_;
};

std::vector<DeltaOp> make_delta(const uint8_t* data, std::size_t size, uint32_t chunk_size,
                                const ChunkSet& inventory);
std::vector<DeltaOp> make_delta(const std::vector<uint8_t>& data, uint32_t chunk_size, const ChunkSet& inventory);

// Rebuilds the new content from ops and the prior version (base).
// Throws tether::Error(Encoding) when a Copy reaches outside base.
std::vector<uint8_t> apply_delta(const std::vector<DeltaOp>& ops, const std::vector<uint8_t>& base);

} // namespace tether::transfer
