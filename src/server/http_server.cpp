#include "server/http_server.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/log/trivial.hpp>
#include "store/chunk_store.hpp"

namespace dfp::server {

namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

constexpr std::chrono::seconds IO_TIMEOUT{30};

std::unique_ptr<crypto::CipherEngine> make_engine(const config::ServerConfig& config,
                                                  crypto::KeypairCache* cache) {
  if (cache) {
    return std::make_unique<crypto::CipherEngine>(cache->get(config.cipher.passphrase, config.cipher.salt));
  }
  return std::make_unique<crypto::CipherEngine>(config.cipher.passphrase, config.cipher.salt);
}

ScratchFactory make_scratch_factory(const config::ServerConfig& config) {
  std::filesystem::path root = config.scratch_root.empty()
    ? std::filesystem::temp_directory_path()
    : config.scratch_root;
  return [root](const std::string& session_id) -> std::shared_ptr<store::ChunkStore> {
    return std::make_shared<store::FileChunkStore>(root / ("file_transfer_" + session_id));
  };
}

ReconstructionSettings make_reconstruction(const config::ServerConfig& config, crypto::KeypairCache* cache) {
  ReconstructionSettings settings;
  settings.output_dir = config.output_dir;
  settings.decrypt = config.cipher.enable_encryption;
  settings.passphrase = config.cipher.passphrase;
  settings.salt = config.cipher.salt;
  settings.decrypt_workers = crypto::host_parallelism();
  settings.keypair_cache = cache;
  return settings;
}

// One request, one response, then close
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
  HttpConnection(tcp::socket&& socket, RequestRouter& router, uint64_t body_limit)
    : stream_(std::move(socket)), router_(router), body_limit_(body_limit) {}

  void start() {
    parser_.emplace();
    parser_->body_limit(body_limit_);
    stream_.expires_after(IO_TIMEOUT);
    http::async_read(stream_, buffer_, *parser_,
                     beast::bind_front_handler(&HttpConnection::on_read, shared_from_this()));
  }

private:
  void on_read(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
      close();
      return;
    }
    if (ec == http::error::body_limit) {
      BOOST_LOG_TRIVIAL(warning) << "HTTP server: Request body exceeds " << body_limit_ << " bytes";
      response_ = RequestRouter::error_response(http::status::payload_too_large, 11, "Request body too large");
      write();
      return;
    }
    if (ec) {
      BOOST_LOG_TRIVIAL(debug) << "HTTP server: Read error: " << ec.message();
      close();
      return;
    }

    response_ = router_.handle(parser_->release());
    write();
  }

  void write() {
    stream_.expires_after(IO_TIMEOUT);
    http::async_write(stream_, response_,
                      beast::bind_front_handler(&HttpConnection::on_write, shared_from_this()));
  }

  void on_write(beast::error_code ec, std::size_t) {
    if (ec) {
      BOOST_LOG_TRIVIAL(debug) << "HTTP server: Write error: " << ec.message();
    }
    close();
  }

  void close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    stream_.socket().close(ec);
  }

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  std::optional<http::request_parser<http::string_body>> parser_;
  HttpResponse response_;
  RequestRouter& router_;
  uint64_t body_limit_;
};

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

HttpServer::HttpServer(const config::ServerConfig& config, ClockFn clock)
  : config_(config),
    keypair_cache_(config.cipher.cache_keypairs ? std::make_unique<crypto::KeypairCache>() : nullptr),
    engine_(make_engine(config_, keypair_cache_.get())),
    sessions_(make_scratch_factory(config_), clock),
    auth_gate_(*engine_, config_.auth_window, clock),
    receiver_(sessions_),
    finalizer_(sessions_, make_reconstruction(config_, keypair_cache_.get())),
    task_pool_(config_.task_threads),
    router_(sessions_, auth_gate_, *engine_, receiver_, finalizer_, task_pool_,
            RouterTimeouts{config_.chunk_store_timeout, config_.finalize_timeout}),
    connection_pool_(config_.connection_threads),
    janitor_timer_(io_context_) {
  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initializing server on " << config_.host << ":" << config_.port
                          << (config_.cipher.enable_encryption ? " with" : " without") << " chunk encryption";
}

HttpServer::~HttpServer() {
  stop();
}

//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool HttpServer::start(bool handle_signals) {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP server: Server already running";
    return false;
  }

  try {
    tcp::resolver resolver(io_context_);
    const auto results = resolver.resolve(config_.host, std::to_string(config_.port));
    if (results.empty()) {
      BOOST_LOG_TRIVIAL(error) << "HTTP server: Could not resolve " << config_.host;
      return false;
    }
    const tcp::endpoint endpoint = results.begin()->endpoint();

    acceptor_ = std::make_unique<tcp::acceptor>(io_context_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen(boost::asio::socket_base::max_listen_connections);
    bound_port_ = acceptor_->local_endpoint().port();

    is_running_ = true;
    start_accept();
    schedule_sweep();

    if (handle_signals) {
      signals_.emplace(io_context_, SIGINT, SIGTERM);
      signals_->async_wait([this](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
          return;
        }
        BOOST_LOG_TRIVIAL(info) << "HTTP server: Received signal " << signal_number << ", shutting down server...";
        request_shutdown();
      });
    }

    // Start io_context in a separate thread
    io_thread_ = std::make_unique<std::thread>([this]() {
      try {
        auto work = boost::asio::make_work_guard(io_context_);
        io_context_.run();
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "HTTP server: IO context error: " << e.what();
        is_running_ = false;
      }
    });

    BOOST_LOG_TRIVIAL(info) << "HTTP server: Server started successfully on "
                            << endpoint.address().to_string() << ":" << bound_port_;
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Failed to start server: " << e.what();
    acceptor_.reset();
    is_running_ = false;
    return false;
  }
}

void HttpServer::wait() {
  std::unique_lock<std::mutex> lock(shutdown_mutex_);
  shutdown_cv_.wait(lock, [this] { return shutdown_requested_; });
}

void HttpServer::request_shutdown() {
  {
    std::lock_guard<std::mutex> lock(shutdown_mutex_);
    shutdown_requested_ = true;
  }
  shutdown_cv_.notify_all();
}

void HttpServer::stop() {
  const bool was_running = is_running_.exchange(false);
  if (!was_running && !(io_thread_ && io_thread_->joinable())) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initiating server shutdown";

  // Stop io_context, then release the acceptor from this thread
  io_context_.stop();
  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }

  boost::system::error_code ec;
  if (acceptor_ && acceptor_->is_open()) {
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "HTTP server: Error closing acceptor: " << ec.message();
    }
  }
  janitor_timer_.cancel();
  if (signals_) {
    signals_->cancel(ec);
  }

  task_pool_.stop();
  connection_pool_.stop();
  connection_pool_.join();
  task_pool_.join();

  const size_t removed = sessions_.sweep_expired(config_.session_ttl);
  BOOST_LOG_TRIVIAL(info) << "HTTP server: Final sweep removed " << removed << " expired sessions";

  request_shutdown();
  BOOST_LOG_TRIVIAL(info) << "HTTP server: Server shutdown complete";
}

//==============================================
// CONNECTION HANDLING
//==============================================

void HttpServer::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  // Each accepted socket is bound to its own strand on the connection pool
  acceptor_->async_accept(boost::asio::make_strand(connection_pool_),
    [this](const boost::system::error_code& error, tcp::socket socket) {
      if (!error) {
        BOOST_LOG_TRIVIAL(debug) << "HTTP server: Accepted connection";
        std::make_shared<HttpConnection>(std::move(socket), router_, config_.max_body_bytes)->start();
      } else if (error == boost::asio::error::operation_aborted) {
        return;
      } else {
        BOOST_LOG_TRIVIAL(error) << "HTTP server: Accept error: " << error.message();
      }
      start_accept();  // Continue accepting new connections
    });
}

void HttpServer::schedule_sweep() {
  janitor_timer_.expires_after(config_.sweep_interval);
  janitor_timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec) {
      return;
    }
    const size_t removed = sessions_.sweep_expired(config_.session_ttl);
    if (removed > 0) {
      BOOST_LOG_TRIVIAL(info) << "HTTP server: Janitor removed " << removed << " expired sessions";
    }
    schedule_sweep();
  });
}

} // namespace dfp::server
