#ifndef FTECHO_NETWORK_PROTOCOL_ERROR_HPP
#define FTECHO_NETWORK_PROTOCOL_ERROR_HPP

#include <stdexcept>
#include <string>

namespace ftecho {
namespace network {

enum class ProtocolErrorCode {
    TRUNCATED,
    INVALID_LENGTH,
    TOO_LARGE,
    UNKNOWN_TYPE
};

inline const char* protocol_error_to_string(ProtocolErrorCode code) {
    switch (code) {
        case ProtocolErrorCode::TRUNCATED: return "Truncated frame";
        case ProtocolErrorCode::INVALID_LENGTH: return "Invalid frame length";
        case ProtocolErrorCode::TOO_LARGE: return "Frame too large";
        case ProtocolErrorCode::UNKNOWN_TYPE: return "Unknown frame type";
        default: return "Undefined protocol error";
    }
}

// Malformed framing. Frame boundaries can no longer be trusted, so the
// connection that produced it must be closed.
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(ProtocolErrorCode code, const std::string& message)
        : std::runtime_error(std::string(protocol_error_to_string(code)) + ": " + message)
        , code_(code) {}

    ProtocolErrorCode code() const { return code_; }

private:
    ProtocolErrorCode code_;
};

// The byte stream failed underneath the codec (write error, reset, timeout)
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message)
        : std::runtime_error(message) {}
};

// The peer closed the stream cleanly on a frame boundary
class ConnectionClosed : public TransportError {
public:
    explicit ConnectionClosed(const std::string& message)
        : TransportError(message) {}
};

} // namespace network
} // namespace ftecho

#endif // FTECHO_NETWORK_PROTOCOL_ERROR_HPP
