#ifndef DFP_SERVER_SESSION_ERROR_HPP
#define DFP_SERVER_SESSION_ERROR_HPP

#include <cstdint>
#include <set>
#include <stdexcept>
#include <string>

namespace dfp::server {

class SessionError : public std::runtime_error {
public:
  explicit SessionError(const std::string& message) : std::runtime_error(message) {}
};

// Signature missing, undecodable or outside the time window
class AuthenticationFailure : public SessionError {
public:
  explicit AuthenticationFailure(const std::string& message)
    : SessionError("Authentication failed: " + message) {}
};

// Malformed or out-of-range request parameters
class ValidationError : public SessionError {
public:
  explicit ValidationError(const std::string& message) : SessionError(message) {}
};

class SessionNotFound : public SessionError {
public:
  explicit SessionNotFound(const std::string& session_id)
    : SessionError("Session not found: " + session_id) {}
};

class SessionNotActive : public SessionError {
public:
  SessionNotActive(const std::string& session_id, const std::string& status)
    : SessionError("Session not active: " + session_id + " is " + status) {}
};

class IncompleteSessionError : public SessionError {
public:
  explicit IncompleteSessionError(const std::set<uint32_t>& missing)
    : SessionError("Missing chunks: " + describe(missing)), missing_(missing) {}

  const std::set<uint32_t>& missing() const { return missing_; }

private:
  static std::string describe(const std::set<uint32_t>& missing) {
    std::string text = "{";
    for (auto it = missing.begin(); it != missing.end(); ++it) {
      if (it != missing.begin()) {
        text += ", ";
      }
      text += std::to_string(*it);
    }
    return text + "}";
  }

  std::set<uint32_t> missing_;
};

class HashMismatchError : public SessionError {
public:
  HashMismatchError(const std::string& expected, const std::string& actual)
    : SessionError("File hash verification failed: expected " + expected + ", got " + actual) {}
};

class DeadlineExceeded : public SessionError {
public:
  explicit DeadlineExceeded(const std::string& message)
    : SessionError("Timeout: " + message) {}
};

// Raised inside abandoned work once its token has been cancelled
class OperationCancelled : public SessionError {
public:
  explicit OperationCancelled(const std::string& message)
    : SessionError("Cancelled: " + message) {}
};

} // namespace dfp::server

#endif // DFP_SERVER_SESSION_ERROR_HPP
