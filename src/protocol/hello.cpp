#include "tether/protocol/hello.hpp"
#include "tether/error.hpp"
#include <algorithm>

namespace tether::protocol {

Capabilities negotiate(const Capabilities& local, const Capabilities& remote) {
    Capabilities out;
    out.shell_streaming = local.shell_streaming && remote.shell_streaming;
    out.file_delta_sync = local.file_delta_sync && remote.file_delta_sync;
    out.screen_capture = local.screen_capture && remote.screen_capture;
    out.compression = local.compression && remote.compression;
    out.max_payload_size = std::min(local.max_payload_size, remote.max_payload_size);
    return out;
}

std::optional<uint32_t> negotiate_version(const std::vector<uint32_t>& local,
                                          const std::vector<uint32_t>& remote) {
    std::optional<uint32_t> best;
    for (uint32_t version : local) {
        if (std::find(remote.begin(), remote.end(), version) != remote.end()) {
            if (!best || version > *best) {
                best = version;
            }
        }
    }
    return best;
}

std::vector<uint8_t> encode_hello(const Hello& hello) {
    nlohmann::json j = hello;
    std::string text = j.dump();
    return std::vector<uint8_t>(text.begin(), text.end());
}

Hello decode_hello(const uint8_t* data, std::size_t size) {
    try {
        nlohmann::json j = nlohmann::json::parse(data, data + size);
        return j.get<Hello>();
    } catch (const nlohmann::json::exception& e) {
        throw Error(ErrorKind::Encoding, std::string("malformed Hello: ") + e.what());
    }
}

} // namespace tether::protocol
