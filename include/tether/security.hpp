#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <sodium.h>

namespace tether::security {

constexpr std::size_t kDigestSize = crypto_generichash_BYTES; // 32 bytes

using Digest = std::array<uint8_t, kDigestSize>;

// BLAKE2b (libsodium crypto_generichash) over a byte range.
Digest hash(const void* data, std::size_t size);
Digest hash(const std::vector<uint8_t>& bytes);

// Constant-time comparison.
bool digest_equal(const Digest& a, const Digest& b);

std::string to_hex(const Digest& digest);

// Throws tether::Error(Encoding) on malformed input.
Digest digest_from_hex(const std::string& hex);

// Random 16-character identity used in the Hello exchange.
std::string generate_client_id();

// Incremental hashing for content that does not fit in one buffer
// (whole-file verification).
class Hasher {
public:
    Hasher();

    void update(const void* data, std::size_t size);
    Digest finish();

private:
    crypto_generichash_state state_;
    bool finished_ = false;
};

} // namespace tether::security
