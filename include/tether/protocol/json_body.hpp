#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "tether/error.hpp"

namespace tether::protocol {

// Command and response bodies that carry JSON text.
template <typename T>
std::vector<uint8_t> encode_json(const T& value) {
    nlohmann::json j = value;
    const std::string text = j.dump();
    return std::vector<uint8_t>(text.begin(), text.end());
}

// Throws tether::Error(Encoding), naming what, on malformed input.
template <typename T>
T decode_json(const uint8_t* data, std::size_t size, const char* what) {
    try {
        return nlohmann::json::parse(data, data + size).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw Error(ErrorKind::Encoding, std::string("malformed ") + what + ": " + e.what());
    }
}

} // namespace tether::protocol
