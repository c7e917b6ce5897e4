#include "server/auth_gate.hpp"
#include <cmath>
#include <boost/log/trivial.hpp>
#include "utils/encoding.hpp"

namespace dfp::server {

AuthGate::AuthGate(const crypto::CipherEngine& engine, std::chrono::seconds window, ClockFn clock)
  : engine_(engine),
    window_(window),
    clock_(clock ? std::move(clock) : ClockFn([] { return SystemClock::now(); })) {}

void AuthGate::verify(const std::string& signature_b64) const {
  if (signature_b64.empty()) {
    BOOST_LOG_TRIVIAL(warning) << "Auth gate: Missing signature";
    throw AuthenticationFailure("missing signature");
  }

  double client_time = 0.0;
  try {
    const auto plaintext = engine_.decrypt_segments(utils::base64_decode(signature_b64));
    const std::string text(plaintext.begin(), plaintext.end());
    size_t consumed = 0;
    client_time = std::stod(text, &consumed);
    if (consumed != text.size() || !std::isfinite(client_time)) {
      throw std::invalid_argument("trailing characters in timestamp");
    }
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Auth gate: Authentication failed: " << e.what();
    throw AuthenticationFailure("invalid signature");
  }

  const double server_time = unix_seconds(clock_());
  BOOST_LOG_TRIVIAL(debug) << "Auth gate: Client timestamp " << std::fixed << client_time
                           << ", server timestamp " << server_time;
  if (std::fabs(server_time - client_time) > static_cast<double>(window_.count())) {
    BOOST_LOG_TRIVIAL(warning) << "Auth gate: Timestamp outside the " << window_.count() << "s window";
    throw AuthenticationFailure("timestamp outside window");
  }
}

} // namespace dfp::server
