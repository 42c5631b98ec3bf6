#pragma once

#include <stdexcept>
#include <string>

namespace tether {

enum class ErrorKind {
    ConnectionLost,
    ProtocolViolation,
    ChecksumMismatch,
    UnsupportedVersion,
    Timeout,
    Cancelled,
    FileIntegrityFailed,
    FrameTooLarge,
    Encoding,
    RemoteFailure // the peer answered with an error-flagged response
};

const char* to_string(ErrorKind kind);

// Connection-level kinds tear down the whole connection; the rest resolve
// a single request or transfer.
bool is_connection_fatal(ErrorKind kind);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace tether
