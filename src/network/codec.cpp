#include "network/codec.hpp"
#include <boost/log/trivial.hpp>
#include <sstream>
#include <stdexcept>

namespace ftecho {
namespace network {

Codec::Codec(uint32_t max_frame_length)
  : max_frame_length_(max_frame_length) {
  if (max_frame_length_ < 1) {
    throw std::invalid_argument("Codec: Maximum frame length must be at least 1");
  }
  BOOST_LOG_TRIVIAL(debug) << "Codec: Initializing Codec with maximum frame length: " << max_frame_length_;
}

std::size_t Codec::serialize(const Frame& frame, std::ostream& output) const {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid output stream state";
    throw TransportError("Codec: Invalid output stream");
  }

  if (frame.wire_length() > max_frame_length_) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Refusing to send frame of length " << frame.wire_length()
                             << " (maximum " << max_frame_length_ << ")";
    throw ProtocolError(ProtocolErrorCode::TOO_LARGE,
      "outgoing frame length " + std::to_string(frame.wire_length()));
  }

  // Length prefix counts the type byte plus the payload
  uint32_t network_length = to_network_order(static_cast<uint32_t>(frame.wire_length()));
  write_bytes(output, &network_length, sizeof(network_length));

  uint8_t type = static_cast<uint8_t>(frame.type);
  write_bytes(output, &type, sizeof(type));

  if (!frame.payload.empty()) {
    write_bytes(output, frame.payload.data(), frame.payload.size());
  }

  if (!output.flush()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to flush output stream";
    throw TransportError("Codec: Failed to flush output stream");
  }

  BOOST_LOG_TRIVIAL(trace) << "Codec: Sent " << frame.type << " frame, length " << frame.wire_length();
  return LENGTH_PREFIX_SIZE + frame.wire_length();
}

Frame Codec::deserialize(std::istream& input) const {
  // Read length prefix. Zero bytes here means the peer closed between frames.
  uint32_t network_length = 0;
  std::size_t got = read_bytes(input, &network_length, sizeof(network_length));
  if (got == 0) {
    BOOST_LOG_TRIVIAL(debug) << "Codec: Stream closed on frame boundary";
    throw ConnectionClosed("Codec: Stream closed");
  }
  if (got < sizeof(network_length)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Stream closed inside length prefix after " << got << " bytes";
    throw ProtocolError(ProtocolErrorCode::TRUNCATED,
      "length prefix cut short after " + std::to_string(got) + " bytes");
  }

  uint32_t length = from_network_order(network_length);
  if (length == 0) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Received frame with length 0";
    throw ProtocolError(ProtocolErrorCode::INVALID_LENGTH, "length prefix is 0");
  }

  // Reject before touching the payload so the declared size is never allocated
  if (length > max_frame_length_) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Frame length " << length << " exceeds maximum " << max_frame_length_;
    throw ProtocolError(ProtocolErrorCode::TOO_LARGE,
      "declared length " + std::to_string(length) + " exceeds " + std::to_string(max_frame_length_));
  }

  uint8_t type = 0;
  if (read_bytes(input, &type, sizeof(type)) != sizeof(type)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Stream closed before type byte";
    throw ProtocolError(ProtocolErrorCode::TRUNCATED, "missing type byte");
  }

  if (!is_known_frame_type(type)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Unknown frame type byte: " << static_cast<int>(type);
    throw ProtocolError(ProtocolErrorCode::UNKNOWN_TYPE,
      "type byte " + std::to_string(static_cast<int>(type)));
  }

  Frame frame;
  frame.type = static_cast<FrameType>(type);

  std::size_t payload_size = length - 1;
  if (payload_size > 0) {
    frame.payload.resize(payload_size);
    got = read_bytes(input, &frame.payload[0], payload_size);
    if (got != payload_size) {
      BOOST_LOG_TRIVIAL(error) << "Codec: Payload truncated, expected " << payload_size << " bytes, got " << got;
      throw ProtocolError(ProtocolErrorCode::TRUNCATED,
        "payload has " + std::to_string(got) + " of " + std::to_string(payload_size) + " bytes");
    }
  }

  BOOST_LOG_TRIVIAL(trace) << "Codec: Received " << frame.type << " frame, length " << length;
  return frame;
}

std::string Codec::encode(const Frame& frame) const {
  std::ostringstream output;
  serialize(frame, output);
  return output.str();
}

Frame Codec::decode(const std::string& bytes) const {
  std::istringstream input(bytes);
  return deserialize(input);
}

void Codec::write_bytes(std::ostream& output, const void* data, std::size_t size) const {
  if (!output.write(static_cast<const char*>(data), static_cast<std::streamsize>(size))) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to write " << size << " bytes to output stream";
    throw TransportError("Codec: Failed to write to output stream");
  }
}

std::size_t Codec::read_bytes(std::istream& input, void* data, std::size_t size) const {
  input.read(static_cast<char*>(data), static_cast<std::streamsize>(size));
  return static_cast<std::size_t>(input.gcount());
}

} // namespace network
} // namespace ftecho
