#include "server/session.hpp"
#include <cstdio>
#include "crypto/digest.hpp"
#include "server/session_error.hpp"

namespace dfp::server {

const char* to_string(SessionStatus status) {
  switch (status) {
    case SessionStatus::active:     return "active";
    case SessionStatus::finalizing: return "finalizing";
    case SessionStatus::completed:  return "completed";
    default:                        return "unknown";
  }
}

double unix_seconds(SystemClock::time_point when) {
  return std::chrono::duration<double>(when.time_since_epoch()).count();
}

std::string timestamp_text(SystemClock::time_point when) {
  char text[64];
  std::snprintf(text, sizeof(text), "%.6f", unix_seconds(when));
  return text;
}

std::string make_session_id(const std::string& filename, SystemClock::time_point when) {
  return crypto::md5_hex(filename + timestamp_text(when)).substr(0, 16);
}

std::string sanitize_filename(const std::string& filename) {
  // Treat both separators as path delimiters regardless of platform
  const size_t slash = filename.find_last_of("/\\");
  std::string base = slash == std::string::npos ? filename : filename.substr(slash + 1);
  if (base.empty() || base == "." || base == "..") {
    throw ValidationError("Invalid filename: '" + filename + "'");
  }
  if (base.find('\0') != std::string::npos) {
    throw ValidationError("Filename contains NUL byte");
  }
  return base;
}

} // namespace dfp::server
