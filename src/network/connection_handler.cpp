#include "network/connection_handler.hpp"
#include "network/protocol_error.hpp"
#include "transfer/transfer_session.hpp"
#include <boost/log/trivial.hpp>

namespace ftecho {
namespace network {

namespace {

std::string describe_peer(const boost::asio::ip::tcp::socket& socket) {
  boost::system::error_code ec;
  auto endpoint = socket.remote_endpoint(ec);
  if (ec) {
    return "unknown peer";
  }
  return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ConnectionHandler::ConnectionHandler(boost::asio::ip::tcp::socket socket, store::StorageManager& storage,
                                     const config::ServerConfig& config)
  : peer_(describe_peer(socket))
  , stream_(std::move(socket))
  , storage_(storage)
  , codec_(config.max_frame_length)
  , chunk_size_(config.chunk_size)
  , idle_timeout_(config.idle_timeout) {
  BOOST_LOG_TRIVIAL(debug) << "Connection handler: Created for " << peer_;
}

ConnectionHandler::~ConnectionHandler() {
  close();
}

//==============================================
// CONNECTION LIFECYCLE
//==============================================

void ConnectionHandler::run() {
  BOOST_LOG_TRIVIAL(info) << "Connection handler: Client connected: " << peer_;

  try {
    transfer::TransferSession session(storage_, codec_, stream_, stream_, chunk_size_);
    session.set_activity_hook([this]() { touch(); });

    while (session.process_next()) {
    }
    BOOST_LOG_TRIVIAL(info) << "Connection handler: Client " << peer_ << " quit after "
                            << session.operations_completed() << " operations ("
                            << session.operations_failed() << " failed)";
  } catch (const ConnectionClosed& e) {
    if (stream_.error() == boost::asio::error::timed_out) {
      BOOST_LOG_TRIVIAL(warning) << "Connection handler: Client " << peer_ << " idle for "
                                 << idle_timeout_.count() << "s, closing";
    } else {
      BOOST_LOG_TRIVIAL(info) << "Connection handler: Client " << peer_ << " disconnected";
    }
  } catch (const ProtocolError& e) {
    // Frame boundaries are lost; the stream cannot be resynchronized
    BOOST_LOG_TRIVIAL(error) << "Connection handler: Protocol error from " << peer_ << ", closing: " << e.what();
  } catch (const TransportError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Connection handler: Transport failure with " << peer_ << ": " << e.what()
                               << " (" << stream_.error().message() << ")";
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Connection handler: Error handling client " << peer_ << ": " << e.what();
  }

  close();
  finished_ = true;
  BOOST_LOG_TRIVIAL(info) << "Connection handler: Client " << peer_ << " connection closed";
}

void ConnectionHandler::stop() {
  std::lock_guard<std::mutex> lock(socket_mutex_);
  if (!stream_.socket().is_open()) {
    return;
  }
  boost::system::error_code ec;
  stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  if (ec && ec != boost::asio::error::not_connected) {
    BOOST_LOG_TRIVIAL(debug) << "Connection handler: Shutdown of " << peer_ << " reported: " << ec.message();
  }
}

//==============================================
// UTILITY METHODS
//==============================================

void ConnectionHandler::touch() {
  if (idle_timeout_.count() > 0) {
    stream_.expires_after(idle_timeout_);
  }
}

void ConnectionHandler::close() {
  std::lock_guard<std::mutex> lock(socket_mutex_);
  if (stream_.socket().is_open()) {
    stream_.close();
  }
}

} // namespace network
} // namespace ftecho
