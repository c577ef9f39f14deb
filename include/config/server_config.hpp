#ifndef FTECHO_CONFIG_SERVER_CONFIG_HPP
#define FTECHO_CONFIG_SERVER_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <boost/log/trivial.hpp>
#include "network/codec.hpp"
#include "transfer/transfer_session.hpp"

namespace ftecho {
namespace config {

// Deployment parameters of one server process
struct ServerConfig {
  std::string address = "0.0.0.0";
  uint16_t port = 9000;
  std::string storage_root = "storage";
  std::size_t chunk_size = transfer::TransferSession::DEFAULT_CHUNK_SIZE;
  uint32_t max_frame_length = network::Codec::DEFAULT_MAX_FRAME_LENGTH;
  // Zero disables the idle deadline
  std::chrono::seconds idle_timeout{300};
  std::string log_file;
  boost::log::trivial::severity_level log_level = boost::log::trivial::info;

  // Throws std::invalid_argument describing the first bad setting.
  // Port 0 is accepted only when allow_ephemeral_port is set.
  void validate(bool allow_ephemeral_port = false) const;
};

// Parses a command-line number: decimal digits only, no sign, at most max.
// Throws std::invalid_argument naming the option otherwise.
std::uint64_t parse_unsigned(const std::string& text, std::uint64_t max, const std::string& option);

} // namespace config
} // namespace ftecho

#endif // FTECHO_CONFIG_SERVER_CONFIG_HPP
