#include "tether/error.hpp"

namespace tether {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ConnectionLost:      return "connection lost";
        case ErrorKind::ProtocolViolation:   return "protocol violation";
        case ErrorKind::ChecksumMismatch:    return "checksum mismatch";
        case ErrorKind::UnsupportedVersion:  return "unsupported version";
        case ErrorKind::Timeout:             return "timeout";
        case ErrorKind::Cancelled:           return "cancelled";
        case ErrorKind::FileIntegrityFailed: return "file integrity failed";
        case ErrorKind::FrameTooLarge:       return "frame too large";
        case ErrorKind::Encoding:            return "encoding error";
        case ErrorKind::RemoteFailure:       return "remote failure";
    }
    return "unknown error";
}

bool is_connection_fatal(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ConnectionLost:
        case ErrorKind::ProtocolViolation:
        case ErrorKind::ChecksumMismatch:
        case ErrorKind::UnsupportedVersion:
        case ErrorKind::FrameTooLarge:
            return true;
        default:
            return false;
    }
}

Error::Error(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(to_string(kind)) + ": " + message), kind_(kind) {}

} // namespace tether
