#include "crypto/checksum_stream.hpp"
#include <openssl/evp.h>
#include <array>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace ftecho::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw InitializationError("Checksum stream: Failed to create digest context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ChecksumStream::ChecksumStream() : context_(std::make_unique<DigestContext>()) {
  if (!EVP_DigestInit_ex(context_->get(), EVP_sha256(), nullptr)) {
    BOOST_LOG_TRIVIAL(error) << "Checksum stream: Failed to initialize SHA-256 context";
    throw InitializationError("Checksum stream: Failed to initialize SHA-256 context");
  }
}

ChecksumStream::~ChecksumStream() = default;

//==============================================
// DIGEST OPERATIONS
//==============================================

void ChecksumStream::update(const void* data, std::size_t size) {
  if (finalized_) {
    throw DigestError("Checksum stream: update after finalize");
  }
  if (size == 0) {
    return;
  }
  if (!EVP_DigestUpdate(context_->get(), data, size)) {
    BOOST_LOG_TRIVIAL(error) << "Checksum stream: Digest update failed after " << bytes_processed_ << " bytes";
    throw DigestError("Checksum stream: Failed to update digest");
  }
  bytes_processed_ += size;
}

std::uint64_t ChecksumStream::consume(std::istream& input, std::uint64_t limit) {
  std::array<char, BUFFER_SIZE> buffer;
  std::uint64_t consumed = 0;

  while (consumed < limit && input) {
    std::uint64_t remaining = limit - consumed;
    std::size_t want = remaining < buffer.size() ? static_cast<std::size_t>(remaining) : buffer.size();
    input.read(buffer.data(), static_cast<std::streamsize>(want));
    std::size_t got = static_cast<std::size_t>(input.gcount());
    if (got == 0) {
      break;
    }
    update(buffer.data(), got);
    consumed += got;
  }

  BOOST_LOG_TRIVIAL(debug) << "Checksum stream: Consumed " << consumed << " bytes from input stream";
  return consumed;
}

void ChecksumStream::write_through(std::ostream& sink, const void* data, std::size_t size) {
  update(data, size);
  if (!sink.write(static_cast<const char*>(data), static_cast<std::streamsize>(size))) {
    BOOST_LOG_TRIVIAL(error) << "Checksum stream: Failed to write " << size << " bytes to sink";
    throw DigestError("Checksum stream: Failed to write to sink");
  }
}

std::string ChecksumStream::finalize() {
  if (finalized_) {
    throw DigestError("Checksum stream: finalize called twice");
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (!EVP_DigestFinal_ex(context_->get(), digest, &digest_len)) {
    BOOST_LOG_TRIVIAL(error) << "Checksum stream: Failed to finalize digest";
    throw DigestError("Checksum stream: Failed to finalize digest");
  }
  finalized_ = true;

  std::string result = to_hex(digest, digest_len);
  BOOST_LOG_TRIVIAL(debug) << "Checksum stream: Digest over " << bytes_processed_ << " bytes: " << result;
  return result;
}

//==============================================
// UTILITY METHODS
//==============================================

std::string ChecksumStream::digest_of(const std::string& data) {
  ChecksumStream checksum;
  checksum.update(data);
  return checksum.finalize();
}

std::string ChecksumStream::to_hex(const unsigned char* data, std::size_t size) {
  std::stringstream ss;
  for (std::size_t i = 0; i < size; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return ss.str();
}

} // namespace ftecho::crypto
