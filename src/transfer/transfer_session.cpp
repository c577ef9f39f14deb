#include "transfer/transfer_session.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>
#include <boost/log/trivial.hpp>

namespace ftecho {
namespace transfer {

using network::Frame;
using network::FrameType;
using State = TransferState::State;

//==============================================
// CONSTRUCTOR
//==============================================

TransferSession::TransferSession(store::StorageManager& storage, const network::Codec& codec,
                                 std::istream& input, std::ostream& output,
                                 std::size_t chunk_size)
  : storage_(storage)
  , codec_(codec)
  , input_(input)
  , output_(output)
  , chunk_size_(chunk_size) {
  if (chunk_size_ == 0 || chunk_size_ > codec_.max_payload_size()) {
    BOOST_LOG_TRIVIAL(error) << "Transfer session: Chunk size " << chunk_size_ << " does not fit in a frame";
    throw std::invalid_argument("Transfer session: Invalid chunk size");
  }
}

//==============================================
// OPERATION DISPATCH
//==============================================

bool TransferSession::process_next() {
  return handle(receive());
}

bool TransferSession::handle(const Frame& request) {
  BOOST_LOG_TRIVIAL(debug) << "Transfer session: Dispatching " << request.type
                           << " operation, payload " << request.payload.size() << " bytes";

  try {
    if (!network::is_operation_frame(request.type)) {
      throw UnexpectedFrameError(std::string(network::frame_type_to_string(request.type)) +
                                 " frame does not start an operation");
    }

    switch (request.type) {
      case FrameType::LIST:
        handle_list(request.payload);
        break;
      case FrameType::GET:
        handle_get(request.payload);
        break;
      case FrameType::PUT:
        handle_put(request.payload);
        break;
      case FrameType::RESUME:
        handle_resume(request.payload);
        break;
      case FrameType::QUIT:
        handle_quit();
        return false;
      default:
        break;
    }
    ++operations_completed_;
  } catch (const store::StoreError& e) {
    fail_operation(e.what());
  } catch (const TransferError& e) {
    fail_operation(e.what());
  }

  state_.reset();
  return true;
}

//==============================================
// OPERATION HANDLERS
//==============================================

void TransferSession::handle_list(const std::string& payload) {
  if (!payload.empty()) {
    throw InvalidRequestError("LIST takes no payload");
  }
  enter(State::RESPONDING);

  std::vector<store::FileEntry> entries = storage_.list();
  std::string listing = encode_listing(entries);

  // A listing is a single frame; beyond the frame ceiling it cannot be sent
  if (listing.size() > codec_.max_payload_size()) {
    throw TransferError("Listing of " + std::to_string(entries.size()) +
                        " files exceeds the frame size limit");
  }

  send(FrameType::OK, listing);
  BOOST_LOG_TRIVIAL(info) << "Transfer session: Listed " << entries.size() << " files";
}

void TransferSession::handle_get(const std::string& payload) {
  enter(State::RESOLVING_FILE);
  std::unique_ptr<store::CommittedFile> file = storage_.open_committed(payload);
  stream_file(*file, 0, false);
}

void TransferSession::handle_put(const std::string& payload) {
  PutRequest request = parse_put_request(payload);
  store::StorageManager::validate_filename(request.filename);
  BOOST_LOG_TRIVIAL(info) << "Transfer session: PUT " << request.filename << ", " << request.size << " bytes";

  enter(State::AWAITING_READY);
  std::unique_ptr<store::PartialFile> partial = storage_.create_partial(request.filename);
  crypto::ChecksumStream checksum;
  send(FrameType::OK, "Ready to receive");

  enter(State::RECEIVING_DATA);
  receive_sized(*partial, request.size, checksum);

  enter(State::VERIFYING);
  if (partial->size() != request.size) {
    throw SizeMismatchError(request.size, partial->size());
  }
  std::string digest = checksum.finalize();
  storage_.commit(*partial);

  enter(State::COMMITTED);
  send(FrameType::OK, digest);
  BOOST_LOG_TRIVIAL(info) << "Transfer session: PUT completed: " << request.filename
                          << ", size=" << request.size << ", sha=" << digest;
}

void TransferSession::handle_resume(const std::string& payload) {
  ResumeRequest request = parse_resume_request(payload);
  store::StorageManager::validate_filename(request.filename);
  BOOST_LOG_TRIVIAL(info) << "Transfer session: RESUME " << direction_to_string(request.direction)
                          << " " << request.filename << " at offset " << request.offset;

  if (request.direction == Direction::GET) {
    handle_resume_get(request);
  } else {
    handle_resume_put(request);
  }
}

void TransferSession::handle_resume_get(const ResumeRequest& request) {
  enter(State::RESOLVING_FILE);
  std::unique_ptr<store::CommittedFile> file = storage_.open_committed(request.filename);
  if (request.offset > file->size()) {
    throw store::OffsetMismatchError(file->size(), request.offset);
  }
  stream_file(*file, request.offset, true);
}

void TransferSession::handle_resume_put(const ResumeRequest& request) {
  enter(State::AWAITING_READY);
  std::unique_ptr<store::PartialFile> partial =
    storage_.open_partial_for_append(request.filename, request.offset);

  // Seed with the bytes already on disk so the digest covers the whole file
  crypto::ChecksumStream checksum;
  partial->read_prefix([&checksum](const char* data, std::size_t size) {
    checksum.update(data, size);
  }, chunk_size_);

  send(FrameType::OK, encode_resume_ready(request.offset));

  enter(State::RECEIVING_DATA);
  std::string remote_digest = receive_until_checksum(*partial, checksum);

  enter(State::VERIFYING);
  std::string digest = checksum.finalize();
  std::transform(remote_digest.begin(), remote_digest.end(), remote_digest.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (digest != remote_digest) {
    BOOST_LOG_TRIVIAL(warning) << "Transfer session: RESUME PUT of " << request.filename
                               << " failed verification, partial file kept";
    throw ChecksumMismatchError(digest, remote_digest);
  }
  storage_.commit(*partial);

  enter(State::COMMITTED);
  send(FrameType::OK, digest);
  BOOST_LOG_TRIVIAL(info) << "Transfer session: RESUME PUT completed: " << request.filename
                          << ", total_size=" << partial->size() << ", sha=" << digest;
}

void TransferSession::handle_quit() {
  enter(State::CLOSING);
  send(FrameType::OK, "Goodbye");
  BOOST_LOG_TRIVIAL(info) << "Transfer session: Peer requested QUIT";
}

//==============================================
// STREAMING
//==============================================

void TransferSession::stream_file(store::CommittedFile& file, std::uint64_t offset, bool resumed) {
  FileMetadata metadata;
  metadata.size = file.size();
  if (resumed) {
    metadata.offset = offset;
  }

  crypto::ChecksumStream checksum;
  std::vector<char> buffer(chunk_size_);

  // Bytes before the offset are hashed but not sent
  std::uint64_t hashed = 0;
  while (hashed < offset) {
    std::uint64_t remaining = offset - hashed;
    std::size_t want = remaining < buffer.size() ? static_cast<std::size_t>(remaining) : buffer.size();
    std::size_t got = file.read(buffer.data(), want);
    if (got == 0) {
      throw store::IOFailureError(file.name() + " ended before resume offset");
    }
    checksum.update(buffer.data(), got);
    hashed += got;
  }

  send(FrameType::OK, encode_file_metadata(metadata));

  enter(State::STREAMING_OUT);
  std::uint64_t sent = 0;
  std::size_t chunks = 0;
  while (true) {
    std::size_t got = file.read(buffer.data(), buffer.size());
    if (got == 0) {
      break;
    }
    checksum.update(buffer.data(), got);
    send(FrameType::FILE_CHUNK, std::string(buffer.data(), got));
    sent += got;
    ++chunks;
  }

  if (offset + sent != file.size()) {
    BOOST_LOG_TRIVIAL(error) << "Transfer session: " << file.name() << " changed size while being sent";
    throw store::IOFailureError(file.name() + " was truncated during transfer");
  }

  enter(State::FINALIZING);
  std::string digest = checksum.finalize();
  send(FrameType::CHECKSUM, digest);
  BOOST_LOG_TRIVIAL(info) << "Transfer session: " << (resumed ? "RESUME GET" : "GET") << " completed: "
                          << file.name() << ", offset=" << offset << ", sent=" << sent
                          << " bytes in " << chunks << " chunks, sha=" << digest;
}

void TransferSession::receive_sized(store::PartialFile& partial, std::uint64_t declared_size,
                                    crypto::ChecksumStream& checksum) {
  std::uint64_t received = 0;
  while (received < declared_size) {
    Frame frame = receive();
    if (frame.type != FrameType::FILE_CHUNK) {
      throw UnexpectedFrameError(std::string("expected FILE_CHUNK during upload of ") + partial.name() +
                                 ", got " + network::frame_type_to_string(frame.type));
    }
    if (frame.payload.size() > declared_size - received) {
      throw SizeMismatchError(declared_size, received + frame.payload.size());
    }
    checksum.update(frame.payload);
    partial.write(frame.payload);
    received += frame.payload.size();
  }
  BOOST_LOG_TRIVIAL(debug) << "Transfer session: Received " << received << " bytes for " << partial.name();
}

std::string TransferSession::receive_until_checksum(store::PartialFile& partial,
                                                    crypto::ChecksumStream& checksum) {
  while (true) {
    Frame frame = receive();
    if (frame.type == FrameType::CHECKSUM) {
      BOOST_LOG_TRIVIAL(debug) << "Transfer session: Upload of " << partial.name()
                               << " ended at " << partial.size() << " bytes";
      return frame.payload;
    }
    if (frame.type != FrameType::FILE_CHUNK) {
      throw UnexpectedFrameError(std::string("expected FILE_CHUNK or CHECKSUM during resume of ") +
                                 partial.name() + ", got " + network::frame_type_to_string(frame.type));
    }
    checksum.update(frame.payload);
    partial.write(frame.payload);
  }
}

//==============================================
// FRAME I/O
//==============================================

void TransferSession::send(FrameType type, const std::string& payload) {
  if (activity_hook_) {
    activity_hook_();
  }
  codec_.serialize(Frame(type, payload), output_);
}

Frame TransferSession::receive() {
  if (activity_hook_) {
    activity_hook_();
  }
  return codec_.deserialize(input_);
}

void TransferSession::fail_operation(const std::string& message) {
  ++operations_failed_;
  BOOST_LOG_TRIVIAL(warning) << "Transfer session: Operation failed in state "
                             << state_.get_state_string() << ": " << message;
  state_.reset();
  send(FrameType::ERROR, message);
}

void TransferSession::enter(State next) {
  if (!state_.transition_to(next)) {
    BOOST_LOG_TRIVIAL(error) << "Transfer session: Invalid transition from " << state_.get_state_string()
                             << " to " << TransferState::state_to_string(next);
    throw std::logic_error("Transfer session: Invalid state transition");
  }
}

} // namespace transfer
} // namespace ftecho
