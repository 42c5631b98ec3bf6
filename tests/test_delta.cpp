#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <random>
#include "tether/error.hpp"
#include "tether/transfer/delta.hpp"

using namespace tether;
using namespace tether::transfer;

namespace {

std::vector<uint8_t> random_bytes(std::size_t size, uint32_t seed) {
    std::mt19937 rng(seed);
    std::vector<uint8_t> out(size);
    for (auto& b : out) {
        b = static_cast<uint8_t>(rng());
    }
    return out;
}

std::size_t count_type(const std::vector<DeltaOp>& ops, DeltaOpType type) {
    return static_cast<std::size_t>(
        std::count_if(ops.begin(), ops.end(), [type](const DeltaOp& op) { return op.type == type; }));
}

} // namespace

TEST(ChunkSet, CoversFileWithShortTail) {
    auto data = random_bytes(10 * 1024 + 7, 1);
    auto chunks = compute_chunk_set(data, 1024);
    ASSERT_EQ(chunks.size(), 11u);
    EXPECT_EQ(chunks.back().offset, 10u * 1024);
    EXPECT_EQ(chunks.back().length, 7u);
    EXPECT_EQ(chunks[3].hash, security::hash(data.data() + 3 * 1024, 1024));
}

TEST(ChunkSet, EmptyInputHasNoChunks) {
    EXPECT_TRUE(compute_chunk_set(std::vector<uint8_t>{}, 64).empty());
    EXPECT_THROW(compute_chunk_set(std::vector<uint8_t>{1}, 0), Error);
}

TEST(ChunkSet, FileMatchesInMemory) {
    auto path = std::filesystem::temp_directory_path() / "tether_chunkset_test.bin";
    auto data = random_bytes(5000, 2);
    {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }
    auto from_file = compute_chunk_set_from_file(path.string(), 1000);
    auto in_memory = compute_chunk_set(data, 1000);
    ASSERT_EQ(from_file.size(), in_memory.size());
    for (std::size_t i = 0; i < from_file.size(); ++i) {
        EXPECT_EQ(from_file[i].offset, in_memory[i].offset);
        EXPECT_EQ(from_file[i].hash, in_memory[i].hash);
    }
    std::filesystem::remove(path);
    EXPECT_TRUE(compute_chunk_set_from_file(path.string(), 1000).empty());
}

TEST(ChunkSet, JsonCarriesHexHash) {
    ChunkInfo chunk{4096, 512, security::hash(std::vector<uint8_t>{'x'})};
    nlohmann::json j = chunk;
    EXPECT_EQ(j.at("hash").get<std::string>(), security::to_hex(chunk.hash));
    auto back = j.get<ChunkInfo>();
    EXPECT_EQ(back.offset, 4096u);
    EXPECT_EQ(back.length, 512u);
    EXPECT_EQ(back.hash, chunk.hash);
}

TEST(Delta, IdenticalContentIsAllCopies) {
    auto data = random_bytes(64 * 1024, 3);
    auto ops = make_delta(data, 4096, compute_chunk_set(data, 4096));
    EXPECT_EQ(ops.size(), 16u);
    EXPECT_EQ(count_type(ops, DeltaOpType::Write), 0u);
    EXPECT_EQ(apply_delta(ops, data), data);
}

TEST(Delta, NoInventoryIsAllWrites) {
    auto data = random_bytes(9000, 4);
    auto ops = make_delta(data, 4096, {});
    EXPECT_EQ(count_type(ops, DeltaOpType::Copy), 0u);
    EXPECT_EQ(apply_delta(ops, {}), data);
}

TEST(Delta, OnlyChangedBlocksAreWritten) {
    auto base = random_bytes(32 * 1024, 5);
    auto updated = base;
    updated[5000] ^= 0xFF;
    updated.insert(updated.end(), 100, 0x42);

    auto ops = make_delta(updated, 4096, compute_chunk_set(base, 4096));
    EXPECT_EQ(count_type(ops, DeltaOpType::Write), 2u);
    auto rebuilt = apply_delta(ops, base);
    EXPECT_EQ(rebuilt, updated);
    EXPECT_EQ(security::hash(rebuilt), security::hash(updated));
}

TEST(Delta, MovedBlocksAreCopiedFromTheirOldOffset) {
    auto a = random_bytes(1024, 6);
    auto b = random_bytes(1024, 7);
    std::vector<uint8_t> base(a);
    base.insert(base.end(), b.begin(), b.end());
    std::vector<uint8_t> swapped(b);
    swapped.insert(swapped.end(), a.begin(), a.end());

    auto ops = make_delta(swapped, 1024, compute_chunk_set(base, 1024));
    ASSERT_EQ(ops.size(), 2u);
    EXPECT_EQ(ops[0].type, DeltaOpType::Copy);
    EXPECT_EQ(ops[0].source_offset, 1024u);
    EXPECT_EQ(ops[1].source_offset, 0u);
    EXPECT_EQ(apply_delta(ops, base), swapped);
}

TEST(Delta, CopyPastBaseIsRejected) {
    DeltaOp op;
    op.type = DeltaOpType::Copy;
    op.source_offset = 10;
    op.length = 20;
    EXPECT_THROW(apply_delta({op}, std::vector<uint8_t>(16)), Error);
}

TEST(DeltaOpEncoding, WriteCarriesItsData) {
    DeltaOp op;
    op.type = DeltaOpType::Write;
    op.dest_offset = 1ull << 33;
    op.length = 3;
    op.data = {7, 8, 9};
    auto wire = encode_op(op);
    ASSERT_EQ(wire.size(), kDeltaOpHeaderSize + 3);
    auto back = decode_op(wire.data(), wire.size());
    EXPECT_EQ(back.type, DeltaOpType::Write);
    EXPECT_EQ(back.dest_offset, 1ull << 33);
    EXPECT_EQ(back.data, op.data);
}

TEST(DeltaOpEncoding, RejectsMalformedOps) {
    DeltaOp copy;
    copy.type = DeltaOpType::Copy;
    copy.length = 4096;
    auto wire = encode_op(copy);
    EXPECT_EQ(wire.size(), kDeltaOpHeaderSize);

    auto trailing = wire;
    trailing.push_back(0);
    EXPECT_THROW(decode_op(trailing.data(), trailing.size()), Error);

    auto unknown = wire;
    unknown[0] = 9;
    EXPECT_THROW(decode_op(unknown.data(), unknown.size()), Error);

    EXPECT_THROW(decode_op(wire.data(), wire.size() - 1), Error);

    DeltaOp write;
    write.length = 5;
    write.data = {1, 2};
    auto short_write = encode_op(write);
    EXPECT_THROW(decode_op(short_write.data(), short_write.size()), Error);
}
