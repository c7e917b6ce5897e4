#ifndef DFP_SERVER_HTTP_SERVER_HPP
#define DFP_SERVER_HTTP_SERVER_HPP

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <boost/asio.hpp>
#include "config/config.hpp"
#include "crypto/cipher_engine.hpp"
#include "auth_gate.hpp"
#include "chunk_receiver.hpp"
#include "finalizer.hpp"
#include "request_router.hpp"
#include "session_store.hpp"

namespace dfp::server {

// HTTP listener: the acceptor, janitor timer and signal set run on one
// io_context thread; each connection runs on the connection pool and all
// deadline-bounded work on the task pool
class HttpServer {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Derives the server keypair and builds every session component
  explicit HttpServer(const config::ServerConfig& config, ClockFn clock = nullptr);
  ~HttpServer();


  // ---- INITIALIZATION AND TEARDOWN ----
  // Binds host:port and starts serving; returns false if the bind fails
  bool start(bool handle_signals = false);
  // Blocks until a shutdown is requested by a signal or request_shutdown()
  void wait();
  void request_shutdown();
  // Final janitor sweep, then stops accepting and joins every thread
  void stop();


  // ---- GETTERS ----
  // Actual bound port, useful when configured with port 0
  uint16_t port() const { return bound_port_; }
  bool is_running() const { return is_running_; }
  SessionStore& sessions() { return sessions_; }
  const crypto::CipherEngine& engine() const { return *engine_; }

private:

  // ---- CONNECTION HANDLING ----
  void start_accept();
  void schedule_sweep();

  // ---- PARAMETERS ----
  config::ServerConfig config_;
  std::unique_ptr<crypto::KeypairCache> keypair_cache_;
  std::unique_ptr<crypto::CipherEngine> engine_;

  // Session components
  SessionStore sessions_;
  AuthGate auth_gate_;
  ChunkReceiver receiver_;
  Finalizer finalizer_;
  boost::asio::thread_pool task_pool_;
  RequestRouter router_;

  // Server state
  boost::asio::thread_pool connection_pool_;
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  boost::asio::steady_timer janitor_timer_;
  std::optional<boost::asio::signal_set> signals_;
  std::unique_ptr<std::thread> io_thread_;
  std::atomic<bool> is_running_{false};
  uint16_t bound_port_ = 0;

  std::mutex shutdown_mutex_;
  std::condition_variable shutdown_cv_;
  bool shutdown_requested_ = false;
};

} // namespace dfp::server

#endif // DFP_SERVER_HTTP_SERVER_HPP
