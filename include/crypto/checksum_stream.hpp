#ifndef FTECHO_CRYPTO_CHECKSUM_STREAM_HPP
#define FTECHO_CRYPTO_CHECKSUM_STREAM_HPP

#include <cstdint>
#include <istream>
#include <limits>
#include <memory>
#include <ostream>
#include <string>
#include "crypto/crypto_error.hpp"

namespace ftecho::crypto {

// Forward declaration for OpenSSL digest context
struct DigestContext;

// Incremental SHA-256 over the bytes of one transfer, in transfer order
class ChecksumStream {
public:
  static constexpr std::size_t DIGEST_SIZE = 32;         // SHA-256 output
  static constexpr std::size_t HEX_DIGEST_SIZE = 64;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ChecksumStream();
  ~ChecksumStream();

  ChecksumStream(const ChecksumStream&) = delete;
  ChecksumStream& operator=(const ChecksumStream&) = delete;


  // ---- DIGEST OPERATIONS ----
  // Feeds one chunk into the accumulator
  void update(const void* data, std::size_t size);
  void update(const std::string& chunk) { update(chunk.data(), chunk.size()); }

  // Hashes up to limit bytes from input and returns the count consumed
  std::uint64_t consume(std::istream& input,
    std::uint64_t limit = std::numeric_limits<std::uint64_t>::max());

  // Hashes a chunk and forwards it to the sink unchanged
  void write_through(std::ostream& sink, const void* data, std::size_t size);

  // Lowercase hex digest. May be called once.
  std::string finalize();


  // ---- GETTERS ----
  bool is_finalized() const { return finalized_; }
  std::uint64_t bytes_processed() const { return bytes_processed_; }


  // ---- UTILITY METHODS ----
  // Digest of a whole buffer in one step
  static std::string digest_of(const std::string& data);
  // Lowercase hex rendering of raw bytes
  static std::string to_hex(const unsigned char* data, std::size_t size);

private:
  // ---- PARAMETERS ----
  std::unique_ptr<DigestContext> context_;
  std::uint64_t bytes_processed_ = 0;
  bool finalized_ = false;
  static constexpr std::size_t BUFFER_SIZE = 8192;
};

} // namespace ftecho::crypto

#endif // FTECHO_CRYPTO_CHECKSUM_STREAM_HPP
