#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "tether/protocol/hello.hpp"
#include "tether/protocol/packet.hpp"

namespace tether::networking {
class Responder;
}

namespace tether::protocol {

enum class CommandId : uint32_t {
    Unknown = 0,
    Ping = 1,
    ShellExecute = 2,
    FileRead = 3,
    ScreenStart = 4,
    ScreenStop = 5
};

CommandId command_id_from_wire(uint32_t value);
const char* to_string(CommandId id);

// Capability a command depends on, by its Hello name; nullptr for none.
const char* required_capability(CommandId id);

// False when id depends on a capability the handshake did not agree on.
bool permitted(CommandId id, const Capabilities& negotiated);

// Command payload: 4-byte little-endian id followed by the body.
std::vector<uint8_t> encode_command(CommandId id, const std::vector<uint8_t>& body);

struct CommandView {
    CommandId id = CommandId::Unknown;
    uint32_t raw_id = 0;
    const uint8_t* body = nullptr;
    std::size_t body_size = 0;
};

// Throws tether::Error(Encoding) when the payload is shorter than the id.
CommandView decode_command(const std::vector<uint8_t>& payload);

// Maps command ids to handlers. Installed as a connection's inbound
// command callback; unregistered or unknown ids, and commands whose
// capability was not negotiated, get an error response.
class CommandRouter {
public:
    // The view borrows the command packet; copy the body before deferring work.
    using Handler = std::function<void(const CommandView& command, std::shared_ptr<networking::Responder> responder)>;

    // Starts with a Ping handler that echoes the body.
    CommandRouter();

    void add(CommandId id, Handler handler);
    bool handles(CommandId id) const;

    void dispatch(const Packet& command, std::shared_ptr<networking::Responder> responder) const;

    void operator()(const Packet& command, std::shared_ptr<networking::Responder> responder) const {
        dispatch(command, std::move(responder));
    }

private:
    std::map<CommandId, Handler> handlers_;
};

} // namespace tether::protocol
