#ifndef DFP_CLIENT_TRANSFER_API_HPP
#define DFP_CLIENT_TRANSFER_API_HPP

#include <cstdint>
#include <string>
#include "network_error.hpp"
#include "utils/json.hpp"

namespace dfp::client {

struct SessionRequest {
  // Base64 of the segment-encrypted base name
  std::string filename;
  uint64_t total_size = 0;
  uint32_t total_chunks = 0;
  std::string file_hash;
  // Base64 of the segment-encrypted Unix timestamp
  std::string signature;
};

struct CompletionResponse {
  std::string status;
  std::string output_path;
  std::string message;
};

// The four server endpoints. Every call throws NetworkFailure on failure.
class TransferApi {
public:
  virtual ~TransferApi() = default;

  // GET /cs; returns the session id, empty if the server sent none
  virtual std::string create_session(const SessionRequest& request) = 0;
  // POST /k
  virtual void upload_chunk(const std::string& session_id, uint32_t index, const std::string& payload_b64) = 0;
  // POST /fs
  virtual CompletionResponse complete_session(const std::string& session_id) = 0;
  // GET /status
  virtual utils::Json session_status(const std::string& session_id) = 0;
};

} // namespace dfp::client

#endif // DFP_CLIENT_TRANSFER_API_HPP
