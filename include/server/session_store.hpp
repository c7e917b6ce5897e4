#ifndef DFP_SERVER_SESSION_STORE_HPP
#define DFP_SERVER_SESSION_STORE_HPP

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "session.hpp"
#include "session_error.hpp"
#include "store/chunk_store.hpp"

namespace dfp::server {

// Builds the scratch store for a freshly allocated session id
using ScratchFactory = std::function<std::shared_ptr<store::ChunkStore>(const std::string& session_id)>;

// Registry of in-flight sessions. One mutex guards the map and every status
// transition; storage and cipher work always happen outside it.
class SessionStore {
public:

  // ---- CONSTRUCTOR ----
  // A null clock means the system clock
  explicit SessionStore(ScratchFactory scratch_factory, ClockFn clock = nullptr);


  // ---- LIFECYCLE ----
  // Validates parameters, allocates an id and scratch store, registers an
  // active session and returns its id
  std::string create(const std::string& filename, uint64_t total_size,
                     uint32_t total_chunks, const std::string& expected_hash);
  // Returns the scratch store of an active session and refreshes its activity
  std::shared_ptr<store::ChunkStore> acquire_for_chunk(const std::string& session_id, uint32_t index);
  // Records a stored chunk; the session must still be active
  void record_chunk(const std::string& session_id, uint32_t index, const std::string& location);
  // active -> finalizing; returns a copy of the session for reconstruction
  Session begin_finalize(const std::string& session_id);
  // finalizing -> active after a recoverable finalize failure
  void abort_finalize(const std::string& session_id);
  // finalizing -> completed
  void complete(const std::string& session_id, const std::filesystem::path& output_path);


  // ---- QUERIES ----
  SessionSnapshot status(const std::string& session_id) const;
  size_t size() const;
  SystemClock::time_point now() const { return clock_(); }


  // ---- JANITOR ----
  // Removes sessions idle for longer than ttl, whatever their status, and
  // deletes their scratch data. Returns the number removed.
  size_t sweep_expired(std::chrono::seconds ttl);

private:
  // Requires mutex_ held
  Session& find_locked(const std::string& session_id);
  const Session& find_locked(const std::string& session_id) const;

  ScratchFactory scratch_factory_;
  ClockFn clock_;
  mutable std::mutex mutex_;
  std::map<std::string, Session> sessions_;
};

} // namespace dfp::server

#endif // DFP_SERVER_SESSION_STORE_HPP
