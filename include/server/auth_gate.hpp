#ifndef DFP_SERVER_AUTH_GATE_HPP
#define DFP_SERVER_AUTH_GATE_HPP

#include <chrono>
#include <string>
#include "crypto/cipher_engine.hpp"
#include "session.hpp"
#include "session_error.hpp"

namespace dfp::server {

// Accepts a request iff its signature decrypts, under the server keypair, to
// a Unix timestamp within `window` of the server clock. There is no nonce, so
// a captured signature replays until the window closes.
class AuthGate {
public:
  AuthGate(const crypto::CipherEngine& engine, std::chrono::seconds window, ClockFn clock = nullptr);

  // Throws AuthenticationFailure on any decode, decrypt, parse or window failure
  void verify(const std::string& signature_b64) const;

private:
  const crypto::CipherEngine& engine_;
  std::chrono::seconds window_;
  ClockFn clock_;
};

} // namespace dfp::server

#endif // DFP_SERVER_AUTH_GATE_HPP
