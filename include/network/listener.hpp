#pragma once

#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>
#include "config/server_config.hpp"
#include "network/connection_handler.hpp"
#include "store/storage_manager.hpp"

namespace ftecho {
namespace network {

// Binds the TCP port and runs one ConnectionHandler thread per accepted connection
class Listener {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Listener(const config::ServerConfig& config, store::StorageManager& storage);
  ~Listener();

  Listener(const Listener&) = delete;
  Listener& operator=(const Listener&) = delete;


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start_listener();
  // Stops accepting, then shuts down and joins every open connection
  void shutdown();


  // ---- GETTERS ----
  bool is_running() const { return is_running_; }
  // Port actually bound, useful when configured with port 0
  uint16_t port() const { return bound_port_; }
  std::size_t active_connections();

private:
  struct Worker {
    std::shared_ptr<ConnectionHandler> handler;
    std::thread thread;
  };

  // ---- PARAMETERS ----
  config::ServerConfig config_;
  store::StorageManager& storage_;

  // Server state
  std::unique_ptr<std::thread> io_thread_;
  std::atomic<bool> is_running_{false};
  std::atomic<uint16_t> bound_port_{0};

  // Incoming connection handlers
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;

  // Connection threads
  std::mutex workers_mutex_;
  std::list<Worker> workers_;


  // ---- CONNECTION ACCEPTANCE ----
  // Main listening loop that handles incoming connections
  void start_accept();
  // Hands an accepted socket to a new connection thread
  void spawn_handler(boost::asio::ip::tcp::socket socket);
  // Joins threads whose connection has ended
  void reap_finished();
};

} // namespace network
} // namespace ftecho
