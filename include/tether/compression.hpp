#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace tether::compression {

// zlib deflate at the default level.
std::vector<uint8_t> compress(const uint8_t* data, std::size_t size);

// Inverse of compress(). The original size travels in a 4-byte
// little-endian prefix; output larger than max_size is rejected.
// Throws tether::Error(Encoding) on corrupt input.
std::vector<uint8_t> decompress(const uint8_t* data, std::size_t size, std::size_t max_size);

} // namespace tether::compression
