#ifndef DFP_CLIENT_HTTP_TRANSFER_API_HPP
#define DFP_CLIENT_HTTP_TRANSFER_API_HPP

#include <chrono>
#include <string>
#include <utility>
#include <boost/beast/http.hpp>
#include "transfer_api.hpp"

namespace dfp::client {

struct HttpTimeouts {
  std::chrono::milliseconds request{30000};
  std::chrono::milliseconds completion{60000};
  std::chrono::milliseconds status{10000};
};

// Parsed "http://host[:port][/prefix]"
struct ServerEndpoint {
  std::string host;
  std::string port = "80";
  std::string prefix;
};

// Throws NetworkFailure(INVALID_URL) for anything but plain http URLs
ServerEndpoint parse_server_url(const std::string& url);

// TransferApi over Boost.Beast. Each call opens its own connection, so one
// instance can be shared by any number of upload threads.
class HttpTransferApi : public TransferApi {
public:
  explicit HttpTransferApi(const std::string& server_url, HttpTimeouts timeouts = {});

  std::string create_session(const SessionRequest& request) override;
  void upload_chunk(const std::string& session_id, uint32_t index, const std::string& payload_b64) override;
  CompletionResponse complete_session(const std::string& session_id) override;
  utils::Json session_status(const std::string& session_id) override;

private:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  // Sends one request and returns the response; throws NetworkFailure for
  // transport errors and for statuses >= 400
  Response perform(boost::beast::http::verb method, const std::string& target,
                   const std::string& body, std::chrono::milliseconds timeout) const;
  static utils::Json parse_body(const Response& response);

  ServerEndpoint endpoint_;
  HttpTimeouts timeouts_;
};

} // namespace dfp::client

#endif // DFP_CLIENT_HTTP_TRANSFER_API_HPP
