#include "tether/security.hpp"
#include "tether/error.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace tether::security {

namespace {

void ensure_sodium() {
    static const bool ready = sodium_init() >= 0;
    if (!ready) {
        throw std::runtime_error("libsodium initialization failed");
    }
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

Digest hash(const void* data, std::size_t size) {
    ensure_sodium();
    Digest digest;
    crypto_generichash(digest.data(), digest.size(),
                       static_cast<const unsigned char*>(data), size,
                       nullptr, 0);
    return digest;
}

Digest hash(const std::vector<uint8_t>& bytes) {
    return hash(bytes.data(), bytes.size());
}

bool digest_equal(const Digest& a, const Digest& b) {
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string to_hex(const Digest& digest) {
    std::ostringstream oss;
    for (uint8_t byte : digest) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

Digest digest_from_hex(const std::string& hex) {
    if (hex.size() != kDigestSize * 2) {
        throw Error(ErrorKind::Encoding, "digest hex must be " + std::to_string(kDigestSize * 2) + " characters");
    }
    Digest digest;
    for (std::size_t i = 0; i < kDigestSize; ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw Error(ErrorKind::Encoding, "invalid hex digit in digest");
        }
        digest[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return digest;
}

std::string generate_client_id() {
    ensure_sodium();
    std::array<uint8_t, 8> raw;
    randombytes_buf(raw.data(), raw.size());

    std::ostringstream oss;
    for (uint8_t byte : raw) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

Hasher::Hasher() {
    ensure_sodium();
    crypto_generichash_init(&state_, nullptr, 0, kDigestSize);
}

void Hasher::update(const void* data, std::size_t size) {
    if (finished_) {
        throw std::logic_error("Hasher::update after finish");
    }
    crypto_generichash_update(&state_, static_cast<const unsigned char*>(data), size);
}

Digest Hasher::finish() {
    if (finished_) {
        throw std::logic_error("Hasher::finish called twice");
    }
    finished_ = true;
    Digest digest;
    crypto_generichash_final(&state_, digest.data(), digest.size());
    return digest;
}

} // namespace tether::security
