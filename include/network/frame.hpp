#ifndef FTECHO_NETWORK_FRAME_HPP
#define FTECHO_NETWORK_FRAME_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include <utility>

namespace ftecho {
namespace network {

// Frame type tag, sent as one ASCII byte after the length prefix
enum class FrameType : uint8_t {
    LIST = 'L',
    GET = 'G',
    PUT = 'P',
    RESUME = 'R',
    QUIT = 'Q',
    OK = 'O',
    ERROR = 'E',
    FILE_CHUNK = 'F',
    CHECKSUM = 'S'
};

// One length-prefixed unit of the wire protocol
struct Frame {
    FrameType type;
    std::string payload;

    Frame() : type(FrameType::OK) {}
    Frame(FrameType frame_type, std::string frame_payload = std::string())
        : type(frame_type), payload(std::move(frame_payload)) {}

    // Value of the length prefix on the wire: type byte plus payload
    uint64_t wire_length() const { return 1 + static_cast<uint64_t>(payload.size()); }

    bool operator==(const Frame& other) const {
        return type == other.type && payload == other.payload;
    }
    bool operator!=(const Frame& other) const { return !(*this == other); }
};

// Returns true if the byte is one of the protocol's type tags
inline bool is_known_frame_type(uint8_t tag) {
    switch (static_cast<FrameType>(tag)) {
        case FrameType::LIST:
        case FrameType::GET:
        case FrameType::PUT:
        case FrameType::RESUME:
        case FrameType::QUIT:
        case FrameType::OK:
        case FrameType::ERROR:
        case FrameType::FILE_CHUNK:
        case FrameType::CHECKSUM:
            return true;
    }
    return false;
}

// Returns true for the frame types that start an operation
inline bool is_operation_frame(FrameType type) {
    return type == FrameType::LIST || type == FrameType::GET ||
           type == FrameType::PUT || type == FrameType::RESUME ||
           type == FrameType::QUIT;
}

inline const char* frame_type_to_string(FrameType type) {
    switch (type) {
        case FrameType::LIST: return "LIST";
        case FrameType::GET: return "GET";
        case FrameType::PUT: return "PUT";
        case FrameType::RESUME: return "RESUME";
        case FrameType::QUIT: return "QUIT";
        case FrameType::OK: return "OK";
        case FrameType::ERROR: return "ERROR";
        case FrameType::FILE_CHUNK: return "FILE_CHUNK";
        case FrameType::CHECKSUM: return "CHECKSUM";
    }
    return "UNKNOWN";
}

inline std::ostream& operator<<(std::ostream& os, FrameType type) {
    os << frame_type_to_string(type);
    return os;
}

} // namespace network
} // namespace ftecho

#endif // FTECHO_NETWORK_FRAME_HPP
