#include "tether/compression.hpp"
#include "tether/error.hpp"
#include <boost/endian/conversion.hpp>
#include <limits>
#include <string>
#include <zlib.h>

namespace tether::compression {

namespace {

constexpr std::size_t kSizePrefix = 4;

} // namespace

std::vector<uint8_t> compress(const uint8_t* data, std::size_t size) {
    if (size > std::numeric_limits<uint32_t>::max()) {
        throw Error(ErrorKind::Encoding, "payload too large to compress");
    }

    uLongf bound = compressBound(static_cast<uLong>(size));
    std::vector<uint8_t> out(kSizePrefix + bound);
    boost::endian::store_little_u32(out.data(), static_cast<uint32_t>(size));

    int rc = compress2(out.data() + kSizePrefix, &bound, data, static_cast<uLong>(size), Z_DEFAULT_COMPRESSION);
    if (rc != Z_OK) {
        throw Error(ErrorKind::Encoding, "zlib compress2 failed with code " + std::to_string(rc));
    }
    out.resize(kSizePrefix + bound);
    return out;
}

std::vector<uint8_t> decompress(const uint8_t* data, std::size_t size, std::size_t max_size) {
    if (size < kSizePrefix) {
        throw Error(ErrorKind::Encoding, "compressed payload shorter than its size prefix");
    }
    std::size_t original = boost::endian::load_little_u32(data);
    if (original > max_size) {
        throw Error(ErrorKind::Encoding, "decompressed size " + std::to_string(original) +
                                         " exceeds limit " + std::to_string(max_size));
    }

    std::vector<uint8_t> out(original);
    uLongf out_len = static_cast<uLongf>(original);
    int rc = uncompress(out.data(), &out_len, data + kSizePrefix, static_cast<uLong>(size - kSizePrefix));
    if (rc != Z_OK || out_len != original) {
        throw Error(ErrorKind::Encoding, "zlib uncompress failed with code " + std::to_string(rc));
    }
    return out;
}

} // namespace tether::compression
