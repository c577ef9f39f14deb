#include "client/client.hpp"
#include "network/protocol_error.hpp"
#include "transfer/transfer_error.hpp"
#include <limits>
#include <vector>
#include <boost/log/trivial.hpp>

namespace ftecho {
namespace client {

using network::Frame;
using network::FrameType;

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Client::Client(std::size_t chunk_size, uint32_t max_frame_length)
  : codec_(max_frame_length)
  , chunk_size_(chunk_size) {
  if (chunk_size_ == 0 || chunk_size_ > codec_.max_payload_size()) {
    throw std::invalid_argument("Client: Invalid chunk size");
  }
}

Client::~Client() {
  close();
}

//==============================================
// CONNECTION
//==============================================

void Client::connect(const std::string& host, uint16_t port) {
  close();
  stream_.clear();

  BOOST_LOG_TRIVIAL(info) << "Client: Connecting to " << host << ":" << port;
  stream_.connect(host, std::to_string(port));
  if (!stream_) {
    BOOST_LOG_TRIVIAL(error) << "Client: Connection to " << host << ":" << port
                             << " failed: " << stream_.error().message();
    throw network::TransportError("Client: Failed to connect to " + host + ":" +
                                  std::to_string(port) + ": " + stream_.error().message());
  }
  connected_ = true;
}

void Client::close() {
  if (connected_) {
    stream_.close();
    connected_ = false;
    BOOST_LOG_TRIVIAL(debug) << "Client: Connection closed";
  }
}

//==============================================
// OPERATIONS
//==============================================

std::vector<store::FileEntry> Client::list_files() {
  send_frame(Frame(FrameType::LIST));
  Frame reply = expect_ok();
  return transfer::parse_listing(reply.payload);
}

TransferResult Client::get_file(const std::string& name, std::ostream& out) {
  send_frame(Frame(FrameType::GET, name));
  transfer::FileMetadata metadata = transfer::parse_file_metadata(expect_ok().payload);

  crypto::ChecksumStream checksum;
  std::uint64_t received = 0;
  std::string remote_digest = receive_download(out, checksum, received);

  TransferResult result;
  result.sha256 = checksum.finalize();
  result.bytes = received;

  if (received != metadata.size) {
    throw transfer::SizeMismatchError(metadata.size, received);
  }
  if (result.sha256 != remote_digest) {
    throw transfer::ChecksumMismatchError(result.sha256, remote_digest);
  }
  BOOST_LOG_TRIVIAL(info) << "Client: GET " << name << " completed, " << received << " bytes, sha=" << result.sha256;
  return result;
}

std::string Client::put_file(const std::string& name, std::istream& source, std::uint64_t size) {
  send_frame(Frame(FrameType::PUT, transfer::encode_put_request(transfer::PutRequest{name, size})));
  expect_ok();

  crypto::ChecksumStream checksum;
  std::uint64_t sent = send_chunks(source, checksum, size);
  if (sent != size) {
    // The server is still waiting for bytes; the connection cannot be reused
    close();
    throw transfer::SizeMismatchError(size, sent);
  }

  std::string local_digest = checksum.finalize();
  std::string remote_digest = expect_ok().payload;
  if (local_digest != remote_digest) {
    throw transfer::ChecksumMismatchError(local_digest, remote_digest);
  }
  BOOST_LOG_TRIVIAL(info) << "Client: PUT " << name << " completed, " << size << " bytes, sha=" << remote_digest;
  return remote_digest;
}

TransferResult Client::resume_get(const std::string& name, std::istream& existing, std::ostream& out) {
  crypto::ChecksumStream checksum;
  std::uint64_t offset = checksum.consume(existing);

  transfer::ResumeRequest request{name, offset, transfer::Direction::GET};
  send_frame(Frame(FrameType::RESUME, transfer::encode_resume_request(request)));
  transfer::FileMetadata metadata = transfer::parse_file_metadata(expect_ok().payload);

  std::uint64_t received = 0;
  std::string remote_digest = receive_download(out, checksum, received);

  TransferResult result;
  result.sha256 = checksum.finalize();
  result.bytes = offset + received;

  if (result.bytes != metadata.size) {
    throw transfer::SizeMismatchError(metadata.size, result.bytes);
  }
  if (result.sha256 != remote_digest) {
    throw transfer::ChecksumMismatchError(result.sha256, remote_digest);
  }
  BOOST_LOG_TRIVIAL(info) << "Client: RESUME GET " << name << " from " << offset << " completed, sha=" << result.sha256;
  return result;
}

std::string Client::resume_put(const std::string& name, std::istream& source, std::uint64_t offset) {
  transfer::ResumeRequest request{name, offset, transfer::Direction::PUT};
  send_frame(Frame(FrameType::RESUME, transfer::encode_resume_request(request)));
  std::uint64_t accepted = transfer::parse_resume_ready(expect_ok().payload);
  if (accepted != offset) {
    throw transfer::UnexpectedFrameError("server resumed at " + std::to_string(accepted) +
                                         " instead of " + std::to_string(offset));
  }

  crypto::ChecksumStream checksum;
  if (checksum.consume(source, offset) != offset) {
    close();
    throw transfer::SizeMismatchError(offset, checksum.bytes_processed());
  }
  send_chunks(source, checksum, std::numeric_limits<std::uint64_t>::max());

  std::string local_digest = checksum.finalize();
  send_frame(Frame(FrameType::CHECKSUM, local_digest));

  std::string remote_digest = expect_ok().payload;
  if (local_digest != remote_digest) {
    throw transfer::ChecksumMismatchError(local_digest, remote_digest);
  }
  BOOST_LOG_TRIVIAL(info) << "Client: RESUME PUT " << name << " from " << offset << " completed, sha=" << remote_digest;
  return remote_digest;
}

void Client::quit() {
  if (!connected_) {
    return;
  }
  try {
    send_frame(Frame(FrameType::QUIT));
    receive_frame();
  } catch (const network::TransportError& e) {
    BOOST_LOG_TRIVIAL(debug) << "Client: Server closed before acknowledging QUIT: " << e.what();
  }
  close();
}

//==============================================
// RAW FRAME ACCESS
//==============================================

void Client::send_frame(const Frame& frame) {
  require_connection();
  codec_.serialize(frame, stream_);
}

Frame Client::receive_frame() {
  require_connection();
  return codec_.deserialize(stream_);
}

//==============================================
// HELPERS
//==============================================

Frame Client::expect_ok() {
  Frame reply = receive_frame();
  if (reply.type == FrameType::ERROR) {
    BOOST_LOG_TRIVIAL(warning) << "Client: Server error: " << reply.payload;
    throw RemoteError(reply.payload);
  }
  if (reply.type != FrameType::OK) {
    throw transfer::UnexpectedFrameError(std::string("expected OK, got ") +
                                         network::frame_type_to_string(reply.type));
  }
  return reply;
}

std::string Client::receive_download(std::ostream& out, crypto::ChecksumStream& checksum,
                                     std::uint64_t& received) {
  while (true) {
    Frame frame = receive_frame();
    switch (frame.type) {
      case FrameType::FILE_CHUNK:
        checksum.write_through(out, frame.payload.data(), frame.payload.size());
        received += frame.payload.size();
        break;
      case FrameType::CHECKSUM:
        return frame.payload;
      case FrameType::ERROR:
        throw RemoteError(frame.payload);
      default:
        throw transfer::UnexpectedFrameError(std::string("expected FILE_CHUNK or CHECKSUM, got ") +
                                             network::frame_type_to_string(frame.type));
    }
  }
}

std::uint64_t Client::send_chunks(std::istream& source, crypto::ChecksumStream& checksum,
                                  std::uint64_t limit) {
  std::vector<char> buffer(chunk_size_);
  std::uint64_t sent = 0;
  while (sent < limit && source) {
    std::uint64_t remaining = limit - sent;
    std::size_t want = remaining < buffer.size() ? static_cast<std::size_t>(remaining) : buffer.size();
    source.read(buffer.data(), static_cast<std::streamsize>(want));
    std::size_t got = static_cast<std::size_t>(source.gcount());
    if (got == 0) {
      break;
    }
    checksum.update(buffer.data(), got);
    send_frame(Frame(FrameType::FILE_CHUNK, std::string(buffer.data(), got)));
    sent += got;
  }
  return sent;
}

void Client::require_connection() const {
  if (!connected_) {
    throw network::TransportError("Client: Not connected");
  }
}

} // namespace client
} // namespace ftecho
