#ifndef DFP_SERVER_REQUEST_ROUTER_HPP
#define DFP_SERVER_REQUEST_ROUTER_HPP

#include <chrono>
#include <map>
#include <string>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/http.hpp>
#include "crypto/cipher_engine.hpp"
#include "auth_gate.hpp"
#include "chunk_receiver.hpp"
#include "finalizer.hpp"
#include "session_store.hpp"
#include "utils/json.hpp"

namespace dfp::server {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

struct RouterTimeouts {
  std::chrono::milliseconds chunk_store{30000};
  std::chrono::milliseconds finalize{60000};
};

// Maps the four endpoints onto the session components and every failure onto
// an HTTP status with a JSON error body
class RequestRouter {
public:
  RequestRouter(SessionStore& sessions, const AuthGate& auth_gate, const crypto::CipherEngine& engine,
                ChunkReceiver& receiver, Finalizer& finalizer,
                boost::asio::thread_pool& task_pool, RouterTimeouts timeouts);

  // Never throws; unexpected failures become 500 responses
  HttpResponse handle(const HttpRequest& request);


  // ---- RESPONSE BUILDERS ----
  static HttpResponse json_response(boost::beast::http::status status, unsigned version, const std::string& body);
  static HttpResponse error_response(boost::beast::http::status status, unsigned version, const std::string& message);

private:

  // ---- ENDPOINTS ----
  // GET /cs?f=&s=&c=&h=&g=
  HttpResponse create_session(const std::map<std::string, std::string>& query, unsigned version);
  // POST /k {session_id, chunk_index, chunk_data}
  HttpResponse upload_chunk(const std::string& body, unsigned version);
  // POST /fs {session_id}
  HttpResponse complete_session(const std::string& body, unsigned version);
  // GET /status?s=
  HttpResponse session_status(const std::map<std::string, std::string>& query, unsigned version);

  // Recovers the plaintext filename sent as base64 segmented ciphertext
  std::string decrypt_filename(const std::string& encoded) const;

  SessionStore& sessions_;
  const AuthGate& auth_gate_;
  const crypto::CipherEngine& engine_;
  ChunkReceiver& receiver_;
  Finalizer& finalizer_;
  boost::asio::thread_pool& task_pool_;
  RouterTimeouts timeouts_;
};

} // namespace dfp::server

#endif // DFP_SERVER_REQUEST_ROUTER_HPP
