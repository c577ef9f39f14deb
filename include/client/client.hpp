#ifndef FTECHO_CLIENT_CLIENT_HPP
#define FTECHO_CLIENT_CLIENT_HPP

#include <cstdint>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include "crypto/checksum_stream.hpp"
#include "network/codec.hpp"
#include "network/frame.hpp"
#include "store/storage_manager.hpp"
#include "transfer/metadata.hpp"

namespace ftecho {
namespace client {

// The server answered an operation with an E frame
class RemoteError : public std::runtime_error {
public:
  explicit RemoteError(const std::string& message)
    : std::runtime_error("Server error: " + message)
    , remote_message_(message) {}

  const std::string& remote_message() const { return remote_message_; }

private:
  std::string remote_message_;
};

struct TransferResult {
  std::string sha256;
  // Size of the whole logical file on the local side after the transfer
  std::uint64_t bytes = 0;
};

// Blocking protocol client. One operation at a time per connection.
class Client {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Client(std::size_t chunk_size = 4096,
                  uint32_t max_frame_length = network::Codec::DEFAULT_MAX_FRAME_LENGTH);
  ~Client();

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;


  // ---- CONNECTION ----
  void connect(const std::string& host, uint16_t port);
  void close();
  bool is_connected() const { return connected_; }


  // ---- OPERATIONS ----
  std::vector<store::FileEntry> list_files();
  // Downloads name into out and verifies the server's digest
  TransferResult get_file(const std::string& name, std::ostream& out);
  // Uploads size bytes from source, returns the server's digest after
  // checking it against the local one
  std::string put_file(const std::string& name, std::istream& source, std::uint64_t size);
  // Continues a download. The bytes of existing are the local prefix: they
  // set the offset and seed the digest. The tail is appended to out.
  TransferResult resume_get(const std::string& name, std::istream& existing, std::ostream& out);
  // Continues an upload. source holds the whole file; its first offset bytes
  // are hashed but not sent.
  std::string resume_put(const std::string& name, std::istream& source, std::uint64_t offset);
  // Says goodbye and closes the connection
  void quit();


  // ---- RAW FRAME ACCESS ----
  void send_frame(const network::Frame& frame);
  network::Frame receive_frame();

private:
  // ---- PARAMETERS ----
  boost::asio::ip::tcp::iostream stream_;
  network::Codec codec_;
  std::size_t chunk_size_;
  bool connected_ = false;


  // ---- HELPERS ----
  // Receives the operation's reply, throws RemoteError on E
  network::Frame expect_ok();
  // Receives F frames into out until S, returns the server's digest
  std::string receive_download(std::ostream& out, crypto::ChecksumStream& checksum,
                               std::uint64_t& received);
  // Sends F frames from source until limit bytes or end of stream
  std::uint64_t send_chunks(std::istream& source, crypto::ChecksumStream& checksum,
                            std::uint64_t limit);
  void require_connection() const;
};

} // namespace client
} // namespace ftecho

#endif // FTECHO_CLIENT_CLIENT_HPP
