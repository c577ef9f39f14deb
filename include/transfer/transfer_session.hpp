#ifndef FTECHO_TRANSFER_SESSION_HPP
#define FTECHO_TRANSFER_SESSION_HPP

#include <cstdint>
#include <functional>
#include <istream>
#include <ostream>
#include <string>
#include "crypto/checksum_stream.hpp"
#include "network/codec.hpp"
#include "network/frame.hpp"
#include "store/storage_manager.hpp"
#include "transfer/metadata.hpp"
#include "transfer/transfer_error.hpp"
#include "transfer/transfer_state.hpp"

namespace ftecho {
namespace transfer {

// Runs the operations of one connection over a pair of byte streams.
// Operations are strictly sequential; the session never touches the
// filesystem except through the StorageManager.
class TransferSession {
public:
  // Called before every frame read or write, e.g. to re-arm an idle deadline
  using ActivityHook = std::function<void()>;

  static constexpr std::size_t DEFAULT_CHUNK_SIZE = 4096;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  TransferSession(store::StorageManager& storage, const network::Codec& codec,
                  std::istream& input, std::ostream& output,
                  std::size_t chunk_size = DEFAULT_CHUNK_SIZE);

  TransferSession(const TransferSession&) = delete;
  TransferSession& operator=(const TransferSession&) = delete;


  // ---- OPERATION DISPATCH ----
  // Reads one top-level frame and runs its operation. Returns false once the
  // peer has quit. ProtocolError and TransportError propagate to the caller.
  bool process_next();
  // Runs the operation started by an already decoded top-level frame
  bool handle(const network::Frame& request);


  // ---- GETTERS AND SETTERS ----
  void set_activity_hook(ActivityHook hook) { activity_hook_ = std::move(hook); }
  TransferState::State state() const { return state_.get_state(); }
  std::uint64_t operations_completed() const { return operations_completed_; }
  std::uint64_t operations_failed() const { return operations_failed_; }

private:
  // ---- PARAMETERS ----
  store::StorageManager& storage_;
  const network::Codec& codec_;
  std::istream& input_;
  std::ostream& output_;
  std::size_t chunk_size_;
  ActivityHook activity_hook_;
  TransferState state_;
  std::uint64_t operations_completed_ = 0;
  std::uint64_t operations_failed_ = 0;


  // ---- OPERATION HANDLERS ----
  void handle_list(const std::string& payload);
  void handle_get(const std::string& payload);
  void handle_put(const std::string& payload);
  void handle_resume(const std::string& payload);
  void handle_resume_get(const ResumeRequest& request);
  void handle_resume_put(const ResumeRequest& request);
  void handle_quit();


  // ---- STREAMING ----
  // Sends metadata, F chunks from offset onward and the whole-file digest
  void stream_file(store::CommittedFile& file, std::uint64_t offset, bool resumed);
  // Receives F frames until exactly declared_size bytes have arrived
  void receive_sized(store::PartialFile& partial, std::uint64_t declared_size,
                     crypto::ChecksumStream& checksum);
  // Receives F frames until an S frame arrives, returns its digest
  std::string receive_until_checksum(store::PartialFile& partial, crypto::ChecksumStream& checksum);


  // ---- FRAME I/O ----
  void send(network::FrameType type, const std::string& payload = std::string());
  network::Frame receive();
  void fail_operation(const std::string& message);
  void enter(TransferState::State next);
};

} // namespace transfer
} // namespace ftecho

#endif // FTECHO_TRANSFER_SESSION_HPP
