#include "client/http_transfer_api.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/log/trivial.hpp>
#include "utils/encoding.hpp"

namespace dfp::client {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace {

constexpr const char* USER_AGENT = "DFPClient/1.0";

bool is_connection_error(const beast::error_code& ec) {
  return ec == net::error::connection_refused ||
         ec == net::error::connection_reset ||
         ec == net::error::connection_aborted ||
         ec == net::error::host_unreachable ||
         ec == net::error::network_unreachable ||
         ec == net::error::broken_pipe ||
         ec == net::error::eof ||
         ec == http::error::end_of_stream;
}

// Error message out of a JSON error body, or the raw body
std::string describe_error_body(const std::string& body) {
  try {
    const auto tree = utils::parse_json(body);
    const std::string message = tree.get<std::string>("error", "");
    if (!message.empty()) {
      return message;
    }
  } catch (const utils::JsonError&) {
    // Not JSON; fall through to the raw body
  }
  return body.substr(0, 200);
}

} // namespace

//==============================================
// URL PARSING
//==============================================

ServerEndpoint parse_server_url(const std::string& url) {
  const std::string scheme = "http://";
  if (url.compare(0, scheme.size(), scheme) != 0) {
    throw NetworkFailure(NetworkError::INVALID_URL, "only http:// URLs are supported: " + url);
  }

  std::string rest = url.substr(scheme.size());
  while (!rest.empty() && rest.back() == '/') {
    rest.pop_back();
  }

  ServerEndpoint endpoint;
  const size_t slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  if (slash != std::string::npos) {
    endpoint.prefix = rest.substr(slash);
  }

  const size_t colon = authority.rfind(':');
  if (colon != std::string::npos && authority.find(']') == std::string::npos) {
    endpoint.port = authority.substr(colon + 1);
    authority = authority.substr(0, colon);
  }
  endpoint.host = authority;

  if (endpoint.host.empty() || endpoint.port.empty() ||
      endpoint.port.find_first_not_of("0123456789") != std::string::npos) {
    throw NetworkFailure(NetworkError::INVALID_URL, "malformed server URL: " + url);
  }
  return endpoint;
}

//==============================================
// CONSTRUCTOR
//==============================================

HttpTransferApi::HttpTransferApi(const std::string& server_url, HttpTimeouts timeouts)
  : endpoint_(parse_server_url(server_url)), timeouts_(timeouts) {
  BOOST_LOG_TRIVIAL(debug) << "Transfer API: Using server " << endpoint_.host << ":" << endpoint_.port
                           << endpoint_.prefix;
}

//==============================================
// ENDPOINTS
//==============================================

std::string HttpTransferApi::create_session(const SessionRequest& request) {
  const std::string query = utils::build_query({
    {"f", request.filename},
    {"s", std::to_string(request.total_size)},
    {"c", std::to_string(request.total_chunks)},
    {"h", request.file_hash},
    {"g", request.signature},
  });

  const Response response = perform(http::verb::get, "/cs?" + query, "", timeouts_.request);
  return parse_body(response).get<std::string>("session_id", "");
}

void HttpTransferApi::upload_chunk(const std::string& session_id, uint32_t index, const std::string& payload_b64) {
  utils::Json body;
  body.put("session_id", session_id);
  body.put("chunk_index", index);
  body.put("chunk_data", payload_b64);

  perform(http::verb::post, "/k", utils::to_json(body, {"chunk_index"}), timeouts_.request);
}

CompletionResponse HttpTransferApi::complete_session(const std::string& session_id) {
  utils::Json body;
  body.put("session_id", session_id);

  const Response response = perform(http::verb::post, "/fs", utils::to_json(body), timeouts_.completion);
  const auto tree = parse_body(response);

  CompletionResponse completion;
  completion.status = tree.get<std::string>("status", "");
  completion.output_path = tree.get<std::string>("fp", "");
  completion.message = tree.get<std::string>("message", "");
  return completion;
}

utils::Json HttpTransferApi::session_status(const std::string& session_id) {
  const Response response = perform(http::verb::get, "/status?" + utils::build_query({{"s", session_id}}),
                                    "", timeouts_.status);
  return parse_body(response);
}

//==============================================
// TRANSPORT
//==============================================

HttpTransferApi::Response HttpTransferApi::perform(http::verb method, const std::string& target,
                                                   const std::string& body,
                                                   std::chrono::milliseconds timeout) const {
  http::request<http::string_body> request{method, endpoint_.prefix + target, 11};
  request.set(http::field::host, endpoint_.host);
  request.set(http::field::user_agent, USER_AGENT);
  request.set(http::field::accept, "application/json");
  if (method == http::verb::post) {
    request.set(http::field::content_type, "application/json");
    request.body() = body;
  }
  request.keep_alive(false);
  request.prepare_payload();

  net::io_context ioc;
  tcp::resolver resolver(ioc);
  beast::tcp_stream stream(ioc);
  beast::flat_buffer buffer;
  http::response_parser<http::string_body> parser;
  parser.body_limit(64ull * 1024 * 1024);

  // Each stage records the first failure it sees
  beast::error_code failure;
  bool connected = false;

  resolver.async_resolve(endpoint_.host, endpoint_.port,
    [&](const beast::error_code& ec, tcp::resolver::results_type results) {
      if (ec) {
        failure = ec;
        return;
      }
      stream.expires_after(timeout);
      stream.async_connect(results, [&](const beast::error_code& ec, const tcp::endpoint&) {
        if (ec) {
          failure = ec;
          return;
        }
        connected = true;
        stream.expires_after(timeout);
        http::async_write(stream, request, [&](const beast::error_code& ec, std::size_t) {
          if (ec) {
            failure = ec;
            return;
          }
          http::async_read(stream, buffer, parser, [&](const beast::error_code& ec, std::size_t) {
            failure = ec;
          });
        });
      });
    });

  ioc.run();

  beast::error_code ignored;
  stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

  if (failure) {
    NetworkError kind = NetworkError::PROTOCOL_ERROR;
    if (failure == beast::error::timeout) {
      kind = NetworkError::TIMEOUT;
    } else if (!connected || is_connection_error(failure)) {
      kind = NetworkError::CONNECTION_FAILED;
    }
    BOOST_LOG_TRIVIAL(debug) << "Transfer API: " << http::to_string(method) << " " << target
                             << " failed: " << failure.message();
    throw NetworkFailure(kind, failure.message());
  }

  Response response = parser.release();
  const unsigned status = response.result_int();
  if (status >= 400) {
    throw NetworkFailure(NetworkError::HTTP_STATUS,
                         std::to_string(status) + " " + describe_error_body(response.body()), status);
  }
  return response;
}

utils::Json HttpTransferApi::parse_body(const Response& response) {
  try {
    return utils::parse_json(response.body());
  } catch (const utils::JsonError& e) {
    throw NetworkFailure(NetworkError::PROTOCOL_ERROR, e.what());
  }
}

} // namespace dfp::client
