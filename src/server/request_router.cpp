#include "server/request_router.hpp"
#include <limits>
#include <boost/log/trivial.hpp>
#include "server/deadline.hpp"
#include "utils/encoding.hpp"

namespace dfp::server {

namespace http = boost::beast::http;

namespace {

const std::set<std::string> NUMERIC_KEYS = {
  "status_code", "chunk_index", "progress", "received_chunks", "total_chunks", "transfer_time"
};

std::string query_value(const std::map<std::string, std::string>& query, const std::string& key) {
  auto it = query.find(key);
  return it == query.end() ? std::string() : it->second;
}

// Parses a non-negative decimal integer, rejecting signs and trailing text
uint64_t parse_unsigned(const std::string& text, const std::string& name) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    throw ValidationError("Missing or invalid parameters: " + name);
  }
  try {
    return std::stoull(text);
  } catch (const std::out_of_range&) {
    throw ValidationError("Missing or invalid parameters: " + name + " out of range");
  }
}

void add_common_headers(HttpResponse& response) {
  response.set(http::field::content_type, "application/json");
  response.set(http::field::access_control_allow_origin, "*");
  response.set(http::field::server, "DFP/1.0");
  response.keep_alive(false);
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

RequestRouter::RequestRouter(SessionStore& sessions, const AuthGate& auth_gate, const crypto::CipherEngine& engine,
                             ChunkReceiver& receiver, Finalizer& finalizer,
                             boost::asio::thread_pool& task_pool, RouterTimeouts timeouts)
  : sessions_(sessions),
    auth_gate_(auth_gate),
    engine_(engine),
    receiver_(receiver),
    finalizer_(finalizer),
    task_pool_(task_pool),
    timeouts_(timeouts) {}

//==============================================
// DISPATCH
//==============================================

HttpResponse RequestRouter::handle(const HttpRequest& request) {
  const unsigned version = request.version();
  const auto raw_target = request.target();
  const std::string target(raw_target.data(), raw_target.size());
  const size_t question = target.find('?');
  const std::string path = target.substr(0, question);
  const std::string query_text = question == std::string::npos ? std::string() : target.substr(question + 1);

  BOOST_LOG_TRIVIAL(info) << "Router: " << request.method_string() << " " << path;

  try {
    if (request.method() == http::verb::options) {
      HttpResponse response{http::status::no_content, version};
      add_common_headers(response);
      response.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
      response.set(http::field::access_control_allow_headers, "Content-Type");
      response.prepare_payload();
      return response;
    }

    if (request.method() == http::verb::get) {
      if (path == "/cs") {
        return create_session(utils::parse_query(query_text), version);
      }
      if (path == "/status") {
        return session_status(utils::parse_query(query_text), version);
      }
    } else if (request.method() == http::verb::post) {
      if (path == "/k") {
        return upload_chunk(request.body(), version);
      }
      if (path == "/fs") {
        return complete_session(request.body(), version);
      }
    }
    return error_response(http::status::not_found, version, "Not Found");
  } catch (const utils::EncodingError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Router: Malformed request target: " << e.what();
    return error_response(http::status::bad_request, version, e.what());
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Router: Error in " << request.method_string() << " request: " << e.what();
    return error_response(http::status::internal_server_error, version,
                          std::string("Internal Server Error: ") + e.what());
  }
}

//==============================================
// ENDPOINTS
//==============================================

HttpResponse RequestRouter::create_session(const std::map<std::string, std::string>& query, unsigned version) {
  try {
    auth_gate_.verify(query_value(query, "g"));
  } catch (const AuthenticationFailure&) {
    return error_response(http::status::forbidden, version, "Authentication failed");
  }

  try {
    const std::string filename = decrypt_filename(query_value(query, "f"));
    const uint64_t total_size = parse_unsigned(query_value(query, "s"), "s");
    const uint64_t total_chunks = parse_unsigned(query_value(query, "c"), "c");
    if (total_chunks > std::numeric_limits<uint32_t>::max()) {
      throw ValidationError("Missing or invalid parameters: c out of range");
    }

    const std::string session_id = sessions_.create(filename, total_size, static_cast<uint32_t>(total_chunks),
                                                    query_value(query, "h"));
    utils::Json body;
    body.put("session_id", session_id);
    body.put("status", std::string("created"));
    body.put("message", std::string("Session created successfully"));
    return json_response(http::status::ok, version, utils::to_json(body, NUMERIC_KEYS));
  } catch (const ValidationError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Router: Rejected session: " << e.what();
    return error_response(http::status::bad_request, version, e.what());
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Router: Error creating session: " << e.what();
    return error_response(http::status::internal_server_error, version,
                          std::string("Failed to create session: ") + e.what());
  }
}

HttpResponse RequestRouter::upload_chunk(const std::string& body, unsigned version) {
  if (body.empty()) {
    return error_response(http::status::bad_request, version, "No content");
  }

  std::string session_id;
  std::string payload;
  uint32_t index = 0;
  try {
    const utils::Json request = utils::parse_json(body);
    session_id = request.get<std::string>("session_id", "");
    payload = request.get<std::string>("chunk_data", "");
    const std::string index_text = request.get<std::string>("chunk_index", "");
    if (session_id.empty() || index_text.empty() || payload.empty()) {
      return error_response(http::status::bad_request, version, "Missing chunk parameters");
    }
    const uint64_t parsed = parse_unsigned(index_text, "chunk_index");
    if (parsed > std::numeric_limits<uint32_t>::max()) {
      throw ValidationError("chunk_index out of range");
    }
    index = static_cast<uint32_t>(parsed);
  } catch (const utils::JsonError& e) {
    BOOST_LOG_TRIVIAL(error) << "Router: Invalid JSON in request: " << e.what();
    return error_response(http::status::bad_request, version, "Invalid JSON format");
  } catch (const ValidationError& e) {
    return error_response(http::status::bad_request, version, e.what());
  }

  try {
    ChunkReceiver& receiver = receiver_;
    run_with_deadline<void>(task_pool_, timeouts_.chunk_store, "chunk store",
      [&receiver, session_id, index, payload](const CancellationToken& token) {
        receiver.store_chunk(session_id, index, payload, token);
      });
  } catch (const SessionNotFound&) {
    return error_response(http::status::not_found, version, "Session not found");
  } catch (const SessionNotActive&) {
    return error_response(http::status::bad_request, version, "Session not active");
  } catch (const ValidationError& e) {
    return error_response(http::status::bad_request, version, e.what());
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Router: Error processing chunk " << index << ": " << e.what();
    return error_response(http::status::internal_server_error, version,
                          std::string("Failed to process chunk: ") + e.what());
  }

  utils::Json response;
  response.put("status", std::string("success"));
  response.put("chunk_index", index);
  response.put("message", std::string("Chunk uploaded successfully"));
  return json_response(http::status::ok, version, utils::to_json(response, NUMERIC_KEYS));
}

HttpResponse RequestRouter::complete_session(const std::string& body, unsigned version) {
  if (body.empty()) {
    return error_response(http::status::bad_request, version, "No content");
  }

  std::string session_id;
  try {
    session_id = utils::parse_json(body).get<std::string>("session_id", "");
  } catch (const utils::JsonError& e) {
    BOOST_LOG_TRIVIAL(error) << "Router: Invalid JSON in request: " << e.what();
    return error_response(http::status::bad_request, version, "Invalid JSON format");
  }
  if (session_id.empty()) {
    return error_response(http::status::bad_request, version, "Missing session_id");
  }

  std::filesystem::path output_path;
  try {
    Finalizer& finalizer = finalizer_;
    output_path = run_with_deadline<std::filesystem::path>(task_pool_, timeouts_.finalize, "finalize",
      [&finalizer, session_id](const CancellationToken& token) {
        return finalizer.finalize(session_id, token);
      });
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Router: Error completing session " << session_id << ": " << e.what();
    return error_response(http::status::internal_server_error, version, e.what());
  }

  utils::Json response;
  response.put("status", std::string("completed"));
  response.put("fp", output_path.string());
  response.put("message", std::string("completed successfully"));
  return json_response(http::status::ok, version, utils::to_json(response, NUMERIC_KEYS));
}

HttpResponse RequestRouter::session_status(const std::map<std::string, std::string>& query, unsigned version) {
  const std::string session_id = query_value(query, "s");
  if (session_id.empty()) {
    return error_response(http::status::bad_request, version, "Missing session_id");
  }

  SessionSnapshot snapshot;
  try {
    snapshot = sessions_.status(session_id);
  } catch (const SessionNotFound&) {
    return error_response(http::status::not_found, version, "Session not found");
  }

  utils::Json response;
  response.put("session_id", snapshot.id);
  response.put("status", std::string(to_string(snapshot.status)));
  response.put("progress", snapshot.progress);
  response.put("received_chunks", snapshot.received_chunks);
  response.put("total_chunks", snapshot.total_chunks);
  response.put("filename", snapshot.filename);
  if (snapshot.status == SessionStatus::completed) {
    response.put("file_path", snapshot.output_path.string());
    response.put("transfer_time", snapshot.transfer_time.value_or(0.0));
  }
  return json_response(http::status::ok, version, utils::to_json(response, NUMERIC_KEYS));
}

//==============================================
// UTILITY METHODS
//==============================================

std::string RequestRouter::decrypt_filename(const std::string& encoded) const {
  if (encoded.empty()) {
    throw ValidationError("Missing or invalid parameters");
  }
  try {
    const auto plaintext = engine_.decrypt_segments(utils::base64_decode(encoded));
    return std::string(plaintext.begin(), plaintext.end());
  } catch (const std::exception& e) {
    throw ValidationError(std::string("Missing or invalid parameters: undecodable filename (") + e.what() + ")");
  }
}

HttpResponse RequestRouter::json_response(http::status status, unsigned version, const std::string& body) {
  HttpResponse response{status, version};
  add_common_headers(response);
  response.body() = body;
  response.prepare_payload();
  return response;
}

HttpResponse RequestRouter::error_response(http::status status, unsigned version, const std::string& message) {
  utils::Json body;
  body.put("error", message);
  body.put("status_code", static_cast<unsigned>(status));
  return json_response(status, version, utils::to_json(body, NUMERIC_KEYS));
}

} // namespace dfp::server
