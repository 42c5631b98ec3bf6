#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace tether::protocol {

// Body of ScreenStart (JSON): where the target sends its UDP frame stream.
struct ScreenStartRequest {
    std::string host;
    uint16_t port = 0;
    uint32_t fps = 30;
    uint32_t quality = 80; // 1..100, handed to the capture provider
    uint32_t monitor = 0;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ScreenStartRequest, host, port, fps, quality, monitor)

// Terminal response of ScreenStart.
struct ScreenStartReply {
    uint32_t fps = 0;
    uint32_t mtu = 0;
    uint32_t first_sequence = 0;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ScreenStartReply, fps, mtu, first_sequence)

} // namespace tether::protocol
