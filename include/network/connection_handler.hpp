#ifndef FTECHO_NETWORK_CONNECTION_HANDLER_HPP
#define FTECHO_NETWORK_CONNECTION_HANDLER_HPP

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <boost/asio.hpp>
#include "config/server_config.hpp"
#include "network/codec.hpp"
#include "store/storage_manager.hpp"

namespace ftecho {
namespace network {

// Serves one accepted connection: decodes top-level frames and hands them to
// a TransferSession until QUIT, a protocol error or disconnect. Every failure
// is contained here so it cannot reach the listener or other connections.
class ConnectionHandler {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ConnectionHandler(boost::asio::ip::tcp::socket socket, store::StorageManager& storage,
                    const config::ServerConfig& config);
  ~ConnectionHandler();

  ConnectionHandler(const ConnectionHandler&) = delete;
  ConnectionHandler& operator=(const ConnectionHandler&) = delete;


  // ---- CONNECTION LIFECYCLE ----
  // Blocking loop, returns when the connection is over
  void run();
  // Unblocks run() from another thread by shutting the socket down
  void stop();


  // ---- GETTERS ----
  bool is_finished() const { return finished_; }
  const std::string& peer() const { return peer_; }

private:
  // ---- PARAMETERS ----
  // Captured before the socket moves into the stream
  std::string peer_;
  boost::asio::ip::tcp::iostream stream_;
  store::StorageManager& storage_;
  Codec codec_;
  std::size_t chunk_size_;
  std::chrono::seconds idle_timeout_;
  std::atomic<bool> finished_{false};
  // Serializes stop() from the listener against close() from run()
  std::mutex socket_mutex_;


  // Re-arms the idle deadline before each frame exchange
  void touch();
  void close();
};

} // namespace network
} // namespace ftecho

#endif // FTECHO_NETWORK_CONNECTION_HANDLER_HPP
