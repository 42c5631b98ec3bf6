#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tether::protocol {

// Body of a ShellExecute command (JSON).
struct ShellRequest {
    std::string command;
    bool pty = false;
    uint64_t timeout_ms = 30000; // 0: no limit
    std::map<std::string, std::string> env;
    std::string working_dir;     // empty: the executor's default
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ShellRequest, command, pty, timeout_ms, env, working_dir)

enum class OutputStream : uint8_t {
    Stdout = 1,
    Stderr = 2
};

// One streamed piece of output. On the wire: stream(1) followed by the
// raw bytes, so binary output passes untouched.
struct ShellOutput {
    OutputStream stream = OutputStream::Stdout;
    std::vector<uint8_t> data;
};

std::vector<uint8_t> encode_shell_output(const ShellOutput& output);

// Throws tether::Error(Encoding) for an empty payload or unknown stream.
ShellOutput decode_shell_output(const uint8_t* data, std::size_t size);

// Terminal response of ShellExecute (JSON). error is set, and exit_code is
// -1, when the command could not be run.
struct ShellExit {
    int32_t exit_code = 0;
    uint64_t total_chunks = 0;
    std::string error;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ShellExit, exit_code, total_chunks, error)

} // namespace tether::protocol
