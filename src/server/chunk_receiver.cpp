#include "server/chunk_receiver.hpp"
#include <boost/log/trivial.hpp>
#include "utils/encoding.hpp"

namespace dfp::server {

void ChunkReceiver::store_chunk(const std::string& session_id, uint32_t index,
                                const std::string& payload_b64, const CancellationToken& token) {
  auto scratch = sessions_.acquire_for_chunk(session_id, index);

  store::Bytes payload;
  try {
    payload = utils::base64_decode(payload_b64);
  } catch (const utils::EncodingError& e) {
    throw ValidationError(std::string("Invalid base64 data: ") + e.what());
  }

  token.throw_if_cancelled("chunk " + std::to_string(index) + " of session " + session_id);
  const std::string location = scratch->put_chunk(index, payload);

  token.throw_if_cancelled("chunk " + std::to_string(index) + " of session " + session_id);
  sessions_.record_chunk(session_id, index, location);

  BOOST_LOG_TRIVIAL(debug) << "Chunk receiver: Processed chunk " << index << " for session " << session_id
                           << " (" << payload.size() << " bytes)";
}

} // namespace dfp::server
