#include "network/listener.hpp"
#include <system_error>

namespace ftecho {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Listener::Listener(const config::ServerConfig& config, store::StorageManager& storage)
  : config_(config)
  , storage_(storage) {
  BOOST_LOG_TRIVIAL(info) << "Listener: Initializing listener on " << config_.address << ":" << config_.port;
}

Listener::~Listener() {
  shutdown();
}

//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool Listener::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "Listener: Server already running";
    return false;
  }

  try {
    boost::asio::ip::tcp::endpoint endpoint(
      boost::asio::ip::make_address(config_.address),
      config_.port
    );

    // Reset the context in case it was stopped by a previous shutdown
    io_context_.restart();
    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(io_context_, endpoint);
    bound_port_ = acceptor_->local_endpoint().port();

    is_running_ = true;

    BOOST_LOG_TRIVIAL(debug) << "Listener: Starting to accept connections";
    start_accept();

    io_thread_ = std::make_unique<std::thread>([this]() {
      try {
        auto work = boost::asio::make_work_guard(io_context_);
        io_context_.run();
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Listener: IO context error: " << e.what();
        is_running_ = false;
      }
    });

    BOOST_LOG_TRIVIAL(info) << "Listener: Listening on " << config_.address << ":" << bound_port_;
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Listener: Failed to start server: " << e.what();
    acceptor_.reset();
    return false;
  }
}

void Listener::shutdown() {
  if (!is_running_ && !io_thread_) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "Listener: Initiating server shutdown";
  is_running_ = false;

  // Stop accepting new connections
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Listener: Error closing acceptor: " << ec.message();
    }
  }

  io_context_.stop();
  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }
  io_thread_.reset();
  acceptor_.reset();

  // Unblock and join every open connection
  std::list<Worker> workers;
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers.swap(workers_);
  }
  for (auto& worker : workers) {
    worker.handler->stop();
  }
  for (auto& worker : workers) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Listener: Server shutdown complete, closed " << workers.size() << " connections";
}

std::size_t Listener::active_connections() {
  std::lock_guard<std::mutex> lock(workers_mutex_);
  std::size_t active = 0;
  for (const auto& worker : workers_) {
    if (!worker.handler->is_finished()) {
      ++active;
    }
  }
  return active;
}

//==============================================
// CONNECTION ACCEPTANCE
//==============================================

void Listener::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  acceptor_->async_accept(
    [this](const boost::system::error_code& error, boost::asio::ip::tcp::socket socket) {
      if (!error) {
        spawn_handler(std::move(socket));
      } else if (error == boost::asio::error::operation_aborted) {
        return;
      } else {
        BOOST_LOG_TRIVIAL(error) << "Listener: Accept error: " << error.message();
      }
      start_accept();  // Continue accepting new connections
    });
}

void Listener::spawn_handler(boost::asio::ip::tcp::socket socket) {
  reap_finished();

  try {
    auto handler = std::make_shared<ConnectionHandler>(std::move(socket), storage_, config_);
    std::lock_guard<std::mutex> lock(workers_mutex_);
    // The thread starts only once its list node exists
    workers_.push_back(Worker{handler, std::thread()});
    try {
      workers_.back().thread = std::thread([handler]() { handler->run(); });
    } catch (const std::system_error&) {
      workers_.pop_back();
      throw;
    }
    BOOST_LOG_TRIVIAL(debug) << "Listener: Spawned handler for " << handler->peer()
                             << ", " << workers_.size() << " connection threads";
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Listener: Failed to start connection handler: " << e.what();
  }
}

void Listener::reap_finished() {
  std::list<Worker> finished;
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
      if (it->handler->is_finished()) {
        finished.splice(finished.end(), workers_, it++);
      } else {
        ++it;
      }
    }
  }
  for (auto& worker : finished) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }
}

} // namespace network
} // namespace ftecho
