#ifndef DFP_SERVER_CHUNK_RECEIVER_HPP
#define DFP_SERVER_CHUNK_RECEIVER_HPP

#include <cstdint>
#include <string>
#include "deadline.hpp"
#include "session_store.hpp"

namespace dfp::server {

// Persists uploaded chunks into their session's scratch store
class ChunkReceiver {
public:
  explicit ChunkReceiver(SessionStore& sessions) : sessions_(sessions) {}

  // Decodes and stores one chunk. Re-storing an index replaces the bytes and
  // leaves the bookkeeping unchanged. Once the token is cancelled nothing is
  // published and received_chunks is not updated.
  void store_chunk(const std::string& session_id, uint32_t index,
                   const std::string& payload_b64, const CancellationToken& token);

private:
  SessionStore& sessions_;
};

} // namespace dfp::server

#endif // DFP_SERVER_CHUNK_RECEIVER_HPP
