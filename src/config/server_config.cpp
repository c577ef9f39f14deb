#include "config/server_config.hpp"
#include <stdexcept>

namespace ftecho {
namespace config {

void ServerConfig::validate(bool allow_ephemeral_port) const {
  if (address.empty()) {
    throw std::invalid_argument("Config: Listen address must not be empty");
  }
  if (port == 0 && !allow_ephemeral_port) {
    throw std::invalid_argument("Config: Port must be between 1 and 65535");
  }
  if (storage_root.empty()) {
    throw std::invalid_argument("Config: Storage directory must not be empty");
  }
  if (max_frame_length < 2) {
    throw std::invalid_argument("Config: Maximum frame length must be at least 2");
  }
  if (chunk_size == 0) {
    throw std::invalid_argument("Config: Chunk size must be positive");
  }
  if (chunk_size > max_frame_length - 1) {
    throw std::invalid_argument("Config: Chunk size " + std::to_string(chunk_size) +
                                " does not fit in a frame of " + std::to_string(max_frame_length) + " bytes");
  }
  if (idle_timeout.count() < 0) {
    throw std::invalid_argument("Config: Idle timeout must not be negative");
  }
}

std::uint64_t parse_unsigned(const std::string& text, std::uint64_t max, const std::string& option) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    throw std::invalid_argument("Config: " + option + " '" + text + "' is not a non-negative integer");
  }
  std::uint64_t value = 0;
  try {
    value = std::stoull(text);
  } catch (const std::out_of_range&) {
    throw std::invalid_argument("Config: " + option + " '" + text + "' is out of range");
  }
  if (value > max) {
    throw std::invalid_argument("Config: " + option + " " + text + " exceeds " + std::to_string(max));
  }
  return value;
}

} // namespace config
} // namespace ftecho
