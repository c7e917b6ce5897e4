#include "server/session_store.hpp"
#include <vector>
#include <boost/log/trivial.hpp>

namespace dfp::server {

//==============================================
// CONSTRUCTOR
//==============================================

SessionStore::SessionStore(ScratchFactory scratch_factory, ClockFn clock)
  : scratch_factory_(std::move(scratch_factory)),
    clock_(clock ? std::move(clock) : ClockFn([] { return SystemClock::now(); })) {
  if (!scratch_factory_) {
    throw std::invalid_argument("Session store: Scratch factory is required");
  }
}

//==============================================
// LIFECYCLE
//==============================================

std::string SessionStore::create(const std::string& filename, uint64_t total_size,
                                 uint32_t total_chunks, const std::string& expected_hash) {
  if (filename.empty() || total_size == 0 || total_chunks == 0) {
    throw ValidationError("Missing or invalid parameters");
  }
  const std::string base_name = sanitize_filename(filename);

  const auto created = clock_();
  const std::string session_id = make_session_id(base_name, created);

  // Directory creation is I/O and stays outside the lock
  auto scratch = scratch_factory_(session_id);

  Session session;
  session.id = session_id;
  session.filename = base_name;
  session.total_size = total_size;
  session.total_chunks = total_chunks;
  session.expected_hash = expected_hash;
  session.scratch = std::move(scratch);
  session.status = SessionStatus::active;
  session.created_at = created;
  session.last_activity = created;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto existing = sessions_.find(session_id);
    if (existing != sessions_.end()) {
      BOOST_LOG_TRIVIAL(warning) << "Session store: Session id collision for " << session_id
                                 << ", replacing session for " << existing->second.filename;
      existing->second = std::move(session);
    } else {
      sessions_.emplace(session_id, std::move(session));
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Session store: Created session " << session_id << " for file "
                          << base_name << " (" << total_chunks << " chunks)";
  return session_id;
}

std::shared_ptr<store::ChunkStore> SessionStore::acquire_for_chunk(const std::string& session_id, uint32_t index) {
  std::lock_guard<std::mutex> lock(mutex_);
  Session& session = find_locked(session_id);
  if (session.status != SessionStatus::active) {
    throw SessionNotActive(session_id, to_string(session.status));
  }
  if (index >= session.total_chunks) {
    throw ValidationError("Chunk index " + std::to_string(index) + " out of range for "
                          + std::to_string(session.total_chunks) + " chunks");
  }
  session.last_activity = clock_();
  return session.scratch;
}

void SessionStore::record_chunk(const std::string& session_id, uint32_t index, const std::string& location) {
  std::lock_guard<std::mutex> lock(mutex_);
  Session& session = find_locked(session_id);
  if (session.status != SessionStatus::active) {
    throw SessionNotActive(session_id, to_string(session.status));
  }
  session.received_chunks.insert(index);
  session.chunk_paths[index] = location;
  session.last_activity = clock_();
}

Session SessionStore::begin_finalize(const std::string& session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  Session& session = find_locked(session_id);
  if (session.status != SessionStatus::active) {
    throw SessionNotActive(session_id, to_string(session.status));
  }
  session.status = SessionStatus::finalizing;
  session.last_activity = clock_();
  return session;
}

void SessionStore::abort_finalize(const std::string& session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  // The janitor may have reclaimed the session in the meantime
  if (it != sessions_.end() && it->second.status == SessionStatus::finalizing) {
    it->second.status = SessionStatus::active;
    BOOST_LOG_TRIVIAL(debug) << "Session store: Session " << session_id << " reverted to active";
  }
}

void SessionStore::complete(const std::string& session_id, const std::filesystem::path& output_path) {
  std::lock_guard<std::mutex> lock(mutex_);
  Session& session = find_locked(session_id);
  if (session.status != SessionStatus::finalizing) {
    throw SessionNotActive(session_id, to_string(session.status));
  }
  const auto now = clock_();
  session.status = SessionStatus::completed;
  session.completed_at = now;
  session.last_activity = now;
  session.output_path = output_path;
}

//==============================================
// QUERIES
//==============================================

SessionSnapshot SessionStore::status(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const Session& session = find_locked(session_id);

  SessionSnapshot snapshot;
  snapshot.id = session.id;
  snapshot.filename = session.filename;
  snapshot.status = session.status;
  snapshot.received_chunks = static_cast<uint32_t>(session.received_chunks.size());
  snapshot.total_chunks = session.total_chunks;
  snapshot.progress = session.total_chunks == 0
    ? 0.0
    : static_cast<double>(snapshot.received_chunks) / session.total_chunks * 100.0;
  if (session.status == SessionStatus::completed) {
    snapshot.output_path = session.output_path;
    if (session.completed_at) {
      snapshot.transfer_time = std::chrono::duration<double>(*session.completed_at - session.created_at).count();
    }
  }
  return snapshot;
}

size_t SessionStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

//==============================================
// JANITOR
//==============================================

size_t SessionStore::sweep_expired(std::chrono::seconds ttl) {
  std::vector<std::pair<std::string, std::shared_ptr<store::ChunkStore>>> expired;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_();
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      if (now - it->second.last_activity > ttl) {
        expired.emplace_back(it->first, it->second.scratch);
        it = sessions_.erase(it);
      } else {
        ++it;
      }
    }
  }

  // Scratch deletion happens after the lock is released
  for (const auto& [session_id, scratch] : expired) {
    try {
      if (scratch) {
        scratch->delete_all();
      }
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(warning) << "Session store: Failed to clean up session " << session_id << ": " << e.what();
    }
    BOOST_LOG_TRIVIAL(info) << "Session store: Cleaned up expired session: " << session_id;
  }
  return expired.size();
}

//==============================================
// UTILITY METHODS
//==============================================

Session& SessionStore::find_locked(const std::string& session_id) {
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    throw SessionNotFound(session_id);
  }
  return it->second;
}

const Session& SessionStore::find_locked(const std::string& session_id) const {
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    throw SessionNotFound(session_id);
  }
  return it->second;
}

} // namespace dfp::server
