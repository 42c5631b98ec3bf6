#include "tether/protocol/shell.hpp"
#include "tether/error.hpp"

namespace tether::protocol {

std::vector<uint8_t> encode_shell_output(const ShellOutput& output) {
    std::vector<uint8_t> out;
    out.reserve(1 + output.data.size());
    out.push_back(static_cast<uint8_t>(output.stream));
    out.insert(out.end(), output.data.begin(), output.data.end());
    return out;
}

ShellOutput decode_shell_output(const uint8_t* data, std::size_t size) {
    if (size == 0) {
        throw Error(ErrorKind::Encoding, "empty shell output fragment");
    }
    if (data[0] != static_cast<uint8_t>(OutputStream::Stdout) && data[0] != static_cast<uint8_t>(OutputStream::Stderr)) {
        throw Error(ErrorKind::Encoding, "unknown output stream " + std::to_string(data[0]));
    }
    ShellOutput output;
    output.stream = static_cast<OutputStream>(data[0]);
    output.data.assign(data + 1, data + size);
    return output;
}

} // namespace tether::protocol
