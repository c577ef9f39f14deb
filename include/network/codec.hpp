#ifndef FTECHO_NETWORK_CODEC_HPP
#define FTECHO_NETWORK_CODEC_HPP

#include <cstdint>
#include <iostream>
#include <string>
#include <boost/endian/conversion.hpp>
#include "network/frame.hpp"
#include "network/protocol_error.hpp"

namespace ftecho {
namespace network {

class Codec {
public:
  // Size of the big-endian length prefix on the wire
  static constexpr std::size_t LENGTH_PREFIX_SIZE = 4;
  // Default ceiling on the length prefix (type byte + payload)
  static constexpr uint32_t DEFAULT_MAX_FRAME_LENGTH = 16 * 1024 * 1024;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Codec(uint32_t max_frame_length = DEFAULT_MAX_FRAME_LENGTH);


  // ---- SERIALIZATION AND DESERIALIZATION ----
  // Writes one frame to the output stream and flushes it, returns bytes written
  std::size_t serialize(const Frame& frame, std::ostream& output) const;
  // Reads exactly one frame from the input stream
  Frame deserialize(std::istream& input) const;

  // Encodes a frame into its wire bytes
  std::string encode(const Frame& frame) const;
  // Decodes one frame from the start of a byte buffer
  Frame decode(const std::string& bytes) const;


  // ---- GETTERS ----
  uint32_t max_frame_length() const { return max_frame_length_; }
  // Largest payload a single frame may carry
  std::size_t max_payload_size() const { return max_frame_length_ - 1; }

private:
  // ---- PARAMETERS ----
  uint32_t max_frame_length_;


  // ---- STREAM OPERATIONS ----
  // Writes bytes to an output stream
  void write_bytes(std::ostream& output, const void* data, std::size_t size) const;
  // Reads bytes from an input stream, returns the count actually read
  std::size_t read_bytes(std::istream& input, void* data, std::size_t size) const;


  // ---- BYTE ORDER CONVERSION ----
  static uint32_t to_network_order(uint32_t host_value) {
    return boost::endian::native_to_big(host_value);
  }
  static uint32_t from_network_order(uint32_t network_value) {
    return boost::endian::big_to_native(network_value);
  }
};

} // namespace network
} // namespace ftecho

#endif // FTECHO_NETWORK_CODEC_HPP
