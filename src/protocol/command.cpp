#include "tether/protocol/command.hpp"
#include "tether/error.hpp"
#include "tether/log.hpp"
#include "tether/networking/connection.hpp"
#include <boost/endian/conversion.hpp>
#include <algorithm>
#include <string>

namespace tether::protocol {

CommandId command_id_from_wire(uint32_t value) {
    switch (value) {
        case 1: return CommandId::Ping;
        case 2: return CommandId::ShellExecute;
        case 3: return CommandId::FileRead;
        case 4: return CommandId::ScreenStart;
        case 5: return CommandId::ScreenStop;
        default: return CommandId::Unknown;
    }
}

const char* to_string(CommandId id) {
    switch (id) {
        case CommandId::Ping:         return "Ping";
        case CommandId::ShellExecute: return "ShellExecute";
        case CommandId::FileRead:     return "FileRead";
        case CommandId::ScreenStart:  return "ScreenStart";
        case CommandId::ScreenStop:   return "ScreenStop";
        case CommandId::Unknown:      break;
    }
    return "Unknown";
}

const char* required_capability(CommandId id) {
    switch (id) {
        case CommandId::ShellExecute: return "shell_streaming";
        case CommandId::FileRead:     return "file_delta_sync";
        case CommandId::ScreenStart:
        case CommandId::ScreenStop:   return "screen_capture";
        case CommandId::Ping:
        case CommandId::Unknown:      break;
    }
    return nullptr;
}

bool permitted(CommandId id, const Capabilities& negotiated) {
    switch (id) {
        case CommandId::ShellExecute: return negotiated.shell_streaming;
        case CommandId::FileRead:     return negotiated.file_delta_sync;
        case CommandId::ScreenStart:
        case CommandId::ScreenStop:   return negotiated.screen_capture;
        case CommandId::Ping:
        case CommandId::Unknown:      break;
    }
    return true;
}

std::vector<uint8_t> encode_command(CommandId id, const std::vector<uint8_t>& body) {
    std::vector<uint8_t> out(4 + body.size());
    boost::endian::store_little_u32(out.data(), static_cast<uint32_t>(id));
    std::copy(body.begin(), body.end(), out.begin() + 4);
    return out;
}

CommandView decode_command(const std::vector<uint8_t>& payload) {
    if (payload.size() < 4) {
        throw Error(ErrorKind::Encoding, "command payload shorter than its id");
    }
    CommandView view;
    view.raw_id = boost::endian::load_little_u32(payload.data());
    view.id = command_id_from_wire(view.raw_id);
    view.body = payload.data() + 4;
    view.body_size = payload.size() - 4;
    return view;
}

CommandRouter::CommandRouter() {
    add(CommandId::Ping, [](const CommandView& command, std::shared_ptr<networking::Responder> responder) {
        responder->finish(std::vector<uint8_t>(command.body, command.body + command.body_size));
    });
}

void CommandRouter::add(CommandId id, Handler handler) {
    handlers_[id] = std::move(handler);
}

bool CommandRouter::handles(CommandId id) const {
    return handlers_.count(id) > 0;
}

void CommandRouter::dispatch(const Packet& command, std::shared_ptr<networking::Responder> responder) const {
    CommandView view;
    try {
        view = decode_command(command.payload());
    } catch (const Error& e) {
        responder->fail(e.what());
        return;
    }

    auto it = handlers_.find(view.id);
    if (view.id == CommandId::Unknown || it == handlers_.end()) {
        log::warn("router", "no handler for command id " + std::to_string(view.raw_id));
        responder->fail("unsupported command id " + std::to_string(view.raw_id));
        return;
    }
    // Responders detached from a connection have nothing negotiated to check.
    if (auto negotiated = responder->capabilities()) {
        if (!permitted(view.id, *negotiated)) {
            log::warn("router", std::string(to_string(view.id)) + " refused, " + required_capability(view.id) +
                                " was not negotiated");
            responder->fail(std::string("capability ") + required_capability(view.id) + " was not negotiated");
            return;
        }
    }
    it->second(view, std::move(responder));
}

} // namespace tether::protocol
