#ifndef DFP_SERVER_SESSION_HPP
#define DFP_SERVER_SESSION_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include "store/chunk_store.hpp"

namespace dfp::server {

using SystemClock = std::chrono::system_clock;
using ClockFn = std::function<SystemClock::time_point()>;

enum class SessionStatus {
  active,
  finalizing,
  completed
};

const char* to_string(SessionStatus status);

struct Session {
  std::string id;
  std::string filename;
  uint64_t total_size = 0;
  uint32_t total_chunks = 0;
  // Lowercase hex MD5, empty when the client sent none
  std::string expected_hash;
  std::shared_ptr<store::ChunkStore> scratch;
  std::set<uint32_t> received_chunks;
  std::map<uint32_t, std::string> chunk_paths;
  SessionStatus status = SessionStatus::active;
  SystemClock::time_point created_at;
  SystemClock::time_point last_activity;
  std::optional<SystemClock::time_point> completed_at;
  std::filesystem::path output_path;
};

// Read-only view returned to status queries
struct SessionSnapshot {
  std::string id;
  std::string filename;
  SessionStatus status = SessionStatus::active;
  uint32_t received_chunks = 0;
  uint32_t total_chunks = 0;
  double progress = 0.0;
  // Set once completed
  std::filesystem::path output_path;
  std::optional<double> transfer_time;
};

// ---- HELPERS ----
// Seconds since the Unix epoch as a double
double unix_seconds(SystemClock::time_point when);
// Decimal text with six fractional digits, e.g. "1700000000.123456"
std::string timestamp_text(SystemClock::time_point when);
// First 16 hex characters of MD5(filename + timestamp_text(when))
std::string make_session_id(const std::string& filename, SystemClock::time_point when);
// Keeps only the final path component; throws ValidationError when nothing
// usable remains ("", ".", "..")
std::string sanitize_filename(const std::string& filename);

} // namespace dfp::server

#endif // DFP_SERVER_SESSION_HPP
